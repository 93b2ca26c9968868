#pragma once

#include "celio/core/type.hpp"
#include "celio/core/error.hpp"
#include "celio/core/selection.hpp"

#include <cstring>
#include <span>
#include <string>
#include <vector>

// =============================================================================
// FILE: celio/core/dense.hpp
// BRIEF: Owning, runtime-typed N-dimensional arrays
//
// DESIGN NOTES:
// - Row-major (C order) storage, one contiguous byte buffer for numeric
//   dtypes and one std::string per element for text dtypes
// - Rank 0 is a scalar (one element, empty shape)
// - Booleans occupy one byte holding 0 or 1
// - Equality treats NaN == NaN (round-trip comparison semantics)
// =============================================================================

namespace celio {

// =============================================================================
// DenseArray
// =============================================================================

class DenseArray {
public:
    /// Empty 1-D float64 array.
    DenseArray() : dtype_(DType::Float64), shape_{0} {}

    /// Zero-initialised (or empty-string) array of the given dtype and shape.
    DenseArray(DType dtype, std::vector<Size> shape);

    // -------------------------------------------------------------------------
    // Factories
    // -------------------------------------------------------------------------

    template <NumericElement T>
    static DenseArray from(const std::vector<T>& values, std::vector<Size> shape = {}) {
        if (shape.empty()) shape = {values.size()};
        DenseArray out(dtype_of_v<T>, std::move(shape));
        CELIO_CHECK_DIM(out.size() == values.size(),
                        "DenseArray::from: shape does not match number of values");
        Size i = 0;
        for (T v : values) {
            std::memcpy(out.bytes_.data() + i * sizeof(T), &v, sizeof(T));
            ++i;
        }
        return out;
    }

    template <NumericElement T>
    static DenseArray scalar(T value) {
        DenseArray out(dtype_of_v<T>, {});
        std::memcpy(out.bytes_.data(), &value, sizeof(T));
        return out;
    }

    static DenseArray strings(std::vector<std::string> values,
                              std::vector<Size> shape = {},
                              DType dtype = DType::String);

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    [[nodiscard]] DType dtype() const noexcept { return dtype_; }
    [[nodiscard]] ElementKind kind() const noexcept { return element_kind(dtype_); }
    [[nodiscard]] const std::vector<Size>& shape() const noexcept { return shape_; }
    [[nodiscard]] Size rank() const noexcept { return shape_.size(); }
    [[nodiscard]] Size size() const noexcept;
    [[nodiscard]] Size nbytes() const noexcept { return bytes_.size(); }
    [[nodiscard]] bool is_scalar() const noexcept { return shape_.empty(); }

    // -------------------------------------------------------------------------
    // Element Access
    // -------------------------------------------------------------------------

    [[nodiscard]] Byte* raw() noexcept { return bytes_.data(); }
    [[nodiscard]] const Byte* raw() const noexcept { return bytes_.data(); }

    template <NumericElement T>
    [[nodiscard]] std::span<T> values() {
        check_dtype(dtype_of_v<T>);
        return {reinterpret_cast<T*>(bytes_.data()), size()};
    }

    template <NumericElement T>
    [[nodiscard]] std::span<const T> values() const {
        check_dtype(dtype_of_v<T>);
        return {reinterpret_cast<const T*>(bytes_.data()), size()};
    }

    [[nodiscard]] std::vector<std::string>& strings();
    [[nodiscard]] const std::vector<std::string>& strings() const;

    /// Numeric element converted to double (flat index).
    [[nodiscard]] double as_double(Size flat) const;

    /// Integer element converted to Index (flat index).
    [[nodiscard]] Index as_index(Size flat) const;

    /// Copy of the elements as std::vector<T>.
    template <NumericElement T>
    [[nodiscard]] std::vector<T> to_vector() const {
        auto v = values<T>();
        return {v.begin(), v.end()};
    }

    // -------------------------------------------------------------------------
    // Transformations
    // -------------------------------------------------------------------------

    /// Gather a multi-axis selection (same semantics as a backend ranged read).
    [[nodiscard]] DenseArray take(const Indices& indices) const;
    [[nodiscard]] DenseArray take(const std::vector<AxisSelection>& sel) const;

    /// Numeric conversion; text dtypes only convert between String and Object.
    [[nodiscard]] DenseArray astype(DType dtype) const;

    [[nodiscard]] DenseArray reshape(std::vector<Size> shape) const;

    friend bool operator==(const DenseArray& a, const DenseArray& b);
    friend bool operator!=(const DenseArray& a, const DenseArray& b) { return !(a == b); }

private:
    void check_dtype(DType expected) const {
        if (CELIO_UNLIKELY(expected != dtype_)) {
            throw TypeMismatchError(std::string("DenseArray holds ") + dtype_name(dtype_) +
                                    ", requested " + dtype_name(expected));
        }
    }

    DType dtype_;
    std::vector<Size> shape_;
    std::vector<Byte> bytes_;
    std::vector<std::string> strings_;
};

// =============================================================================
// RecordArray: structured 1-D array with named fields
// =============================================================================

class RecordArray {
public:
    RecordArray() = default;

    /// Append a field. Every field is 1-D and shares the same length.
    void add_field(std::string name, DenseArray column);

    [[nodiscard]] Size size() const noexcept {
        return columns_.empty() ? 0 : columns_.front().size();
    }

    [[nodiscard]] Size num_fields() const noexcept { return names_.size(); }
    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }
    [[nodiscard]] const std::vector<DenseArray>& fields() const noexcept { return columns_; }
    [[nodiscard]] const DenseArray& field(const std::string& name) const;

    [[nodiscard]] RecordArray take(const AxisSelector& rows) const;

    friend bool operator==(const RecordArray& a, const RecordArray& b) {
        return a.names_ == b.names_ && a.columns_ == b.columns_;
    }

private:
    std::vector<std::string> names_;
    std::vector<DenseArray> columns_;
};

} // namespace celio
