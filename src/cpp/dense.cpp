#include "celio/core/dense.hpp"

#include <cmath>
#include <numeric>
#include <string>
#include <utility>

namespace celio {

namespace {

Size volume(const std::vector<Size>& shape) noexcept {
    return std::accumulate(shape.begin(), shape.end(), Size{1}, std::multiplies<>{});
}

std::vector<Size> row_major_strides(const std::vector<Size>& shape) {
    std::vector<Size> strides(shape.size(), 1);
    for (Size i = shape.size(); i > 1; --i) {
        strides[i - 2] = strides[i - 1] * shape[i - 1];
    }
    return strides;
}

template <typename T>
bool float_equal(const DenseArray& a, const DenseArray& b) {
    auto x = a.values<T>();
    auto y = b.values<T>();
    for (Size i = 0; i < x.size(); ++i) {
        if (x[i] == y[i]) continue;
        if (std::isnan(x[i]) && std::isnan(y[i])) continue;
        return false;
    }
    return true;
}

} // namespace

// =============================================================================
// DenseArray
// =============================================================================

DenseArray::DenseArray(DType dtype, std::vector<Size> shape)
    : dtype_(dtype), shape_(std::move(shape))
{
    const Size n = volume(shape_);
    if (is_text(dtype_)) {
        strings_.resize(n);
    } else {
        bytes_.assign(n * dtype_size(dtype_), Byte{0});
    }
}

DenseArray DenseArray::strings(std::vector<std::string> values,
                               std::vector<Size> shape,
                               DType dtype)
{
    CELIO_CHECK_ARG(is_text(dtype), "DenseArray::strings requires a text dtype");
    if (shape.empty()) shape = {values.size()};
    CELIO_CHECK_DIM(volume(shape) == values.size(),
                    "DenseArray::strings: shape does not match number of values");
    DenseArray out;
    out.dtype_ = dtype;
    out.shape_ = std::move(shape);
    out.strings_ = std::move(values);
    return out;
}

Size DenseArray::size() const noexcept {
    return volume(shape_);
}

std::vector<std::string>& DenseArray::strings() {
    if (!is_text(dtype_)) {
        throw TypeMismatchError(std::string("DenseArray holds ") + dtype_name(dtype_) +
                                ", requested text");
    }
    return strings_;
}

const std::vector<std::string>& DenseArray::strings() const {
    if (!is_text(dtype_)) {
        throw TypeMismatchError(std::string("DenseArray holds ") + dtype_name(dtype_) +
                                ", requested text");
    }
    return strings_;
}

double DenseArray::as_double(Size flat) const {
    CELIO_CHECK_BOUNDS(static_cast<Index>(flat), size(), "DenseArray::as_double: index out of range");
    return visit_numeric(dtype_, [&](auto tag) -> double {
        using T = decltype(tag);
        T v;
        std::memcpy(&v, bytes_.data() + flat * sizeof(T), sizeof(T));
        return static_cast<double>(v);
    });
}

Index DenseArray::as_index(Size flat) const {
    CELIO_CHECK_BOUNDS(static_cast<Index>(flat), size(), "DenseArray::as_index: index out of range");
    if (!is_integer(dtype_) && dtype_ != DType::Bool) {
        throw TypeError(std::string("expected an integer array, got ") + dtype_name(dtype_));
    }
    return visit_numeric(dtype_, [&](auto tag) -> Index {
        using T = decltype(tag);
        T v;
        std::memcpy(&v, bytes_.data() + flat * sizeof(T), sizeof(T));
        return static_cast<Index>(v);
    });
}

DenseArray DenseArray::take(const Indices& indices) const {
    if (is_full_selection(indices)) return *this;
    return take(resolve_indices(indices, shape_));
}

DenseArray DenseArray::take(const std::vector<AxisSelection>& sel) const {
    CELIO_CHECK_DIM(sel.size() == shape_.size(), "DenseArray::take: selection rank mismatch");

    DenseArray out(dtype_, selection_shape(sel));
    const Size n = out.size();
    if (n == 0) return out;

    const auto strides = row_major_strides(shape_);
    const Size width = dtype_size(dtype_);
    const Size rank = shape_.size();
    std::vector<Size> counter(rank, 0);

    for (Size o = 0; o < n; ++o) {
        Size src = 0;
        for (Size ax = 0; ax < rank; ++ax) {
            src += sel[ax][counter[ax]] * strides[ax];
        }
        if (is_text(dtype_)) {
            out.strings_[o] = strings_[src];
        } else {
            std::memcpy(out.bytes_.data() + o * width, bytes_.data() + src * width, width);
        }
        // odometer increment, last axis fastest
        for (Size ax = rank; ax-- > 0;) {
            if (++counter[ax] < sel[ax].size()) break;
            counter[ax] = 0;
        }
    }
    return out;
}

DenseArray DenseArray::astype(DType dtype) const {
    if (dtype == dtype_) return *this;

    if (is_text(dtype) || is_text(dtype_)) {
        if (is_text(dtype) && is_text(dtype_)) {
            DenseArray out = *this;
            out.dtype_ = dtype;
            return out;
        }
        throw TypeError(std::string("cannot convert ") + dtype_name(dtype_) + " to " +
                        dtype_name(dtype));
    }

    DenseArray out(dtype, shape_);
    const Size n = size();
    visit_numeric(dtype_, [&](auto from_tag) {
        using From = decltype(from_tag);
        visit_numeric(dtype, [&](auto to_tag) {
            using To = decltype(to_tag);
            for (Size i = 0; i < n; ++i) {
                From v;
                std::memcpy(&v, bytes_.data() + i * sizeof(From), sizeof(From));
                To w = static_cast<To>(v);
                std::memcpy(out.bytes_.data() + i * sizeof(To), &w, sizeof(To));
            }
        });
    });
    return out;
}

DenseArray DenseArray::reshape(std::vector<Size> shape) const {
    CELIO_CHECK_DIM(volume(shape) == size(), "DenseArray::reshape: element count mismatch");
    DenseArray out = *this;
    out.shape_ = std::move(shape);
    return out;
}

bool operator==(const DenseArray& a, const DenseArray& b) {
    if (a.shape_ != b.shape_) return false;

    // str and object arrays hold the same payload and compare as text
    if (is_text(a.dtype_) || is_text(b.dtype_)) {
        return is_text(a.dtype_) && is_text(b.dtype_) && a.strings_ == b.strings_;
    }

    if (a.dtype_ != b.dtype_) return false;
    if (a.dtype_ == DType::Float32) return float_equal<float>(a, b);
    if (a.dtype_ == DType::Float64) return float_equal<double>(a, b);
    return a.bytes_ == b.bytes_;
}

// =============================================================================
// RecordArray
// =============================================================================

void RecordArray::add_field(std::string name, DenseArray column) {
    CELIO_CHECK_DIM(column.rank() == 1, "RecordArray fields must be 1-D");
    if (!columns_.empty()) {
        CELIO_CHECK_DIM(column.size() == size(),
                        "RecordArray field '" + name + "' has a different length");
    }
    for (const auto& n : names_) {
        CELIO_CHECK_ARG(n != name, "duplicate RecordArray field '" + name + "'");
    }
    names_.push_back(std::move(name));
    columns_.push_back(std::move(column));
}

const DenseArray& RecordArray::field(const std::string& name) const {
    for (Size i = 0; i < names_.size(); ++i) {
        if (names_[i] == name) return columns_[i];
    }
    throw ValueError("RecordArray has no field '" + name + "'");
}

RecordArray RecordArray::take(const AxisSelector& rows) const {
    RecordArray out;
    for (Size i = 0; i < names_.size(); ++i) {
        out.names_.push_back(names_[i]);
        out.columns_.push_back(columns_[i].take(axis0(rows)));
    }
    return out;
}

} // namespace celio
