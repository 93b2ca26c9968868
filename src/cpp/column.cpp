#include "celio/core/column.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace celio {

// =============================================================================
// Categorical
// =============================================================================

Categorical::Categorical()
    : codes_(DType::Int8, {0}),
      categories_(DType::String, {0}),
      ordered_(false)
{}

Categorical::Categorical(DenseArray codes, DenseArray categories, bool ordered)
    : codes_(std::move(codes)), categories_(std::move(categories)), ordered_(ordered)
{
    if (!is_signed_integer(codes_.dtype())) {
        throw TypeError(std::string("categorical codes must be signed integers, got ") +
                        dtype_name(codes_.dtype()));
    }
    CELIO_CHECK_DIM(codes_.rank() == 1, "categorical codes must be 1-D");
    CELIO_CHECK_DIM(categories_.rank() == 1, "categorical categories must be 1-D");

    const auto n_cat = static_cast<Index>(categories_.size());
    for (Size i = 0; i < codes_.size(); ++i) {
        const Index c = codes_.as_index(i);
        if (c < kMissing || c >= n_cat) {
            throw ValueError("categorical code " + std::to_string(c) + " at position " +
                             std::to_string(i) + " is out of range for " +
                             std::to_string(n_cat) + " categories");
        }
    }
}

Categorical Categorical::from_values(const std::vector<std::string>& values,
                                     bool ordered,
                                     const std::optional<std::string>& missing)
{
    std::map<std::string, Index> lookup;
    for (const auto& v : values) {
        if (missing && v == *missing) continue;
        lookup.emplace(v, 0);
    }

    std::vector<std::string> cats;
    cats.reserve(lookup.size());
    for (auto& [name, code] : lookup) {
        code = static_cast<Index>(cats.size());
        cats.push_back(name);
    }

    std::vector<std::int32_t> codes;
    codes.reserve(values.size());
    for (const auto& v : values) {
        if (missing && v == *missing) {
            codes.push_back(static_cast<std::int32_t>(kMissing));
        } else {
            codes.push_back(static_cast<std::int32_t>(lookup.at(v)));
        }
    }

    // narrowest code width that fits, matching what pandas produces
    DenseArray code_array = DenseArray::from(codes);
    if (cats.size() < 128) {
        code_array = code_array.astype(DType::Int8);
    } else if (cats.size() < 32768) {
        code_array = code_array.astype(DType::Int16);
    }
    return Categorical(std::move(code_array), DenseArray::strings(std::move(cats)), ordered);
}

Categorical Categorical::take(const AxisSelector& rows) const {
    return Categorical(codes_.take(axis0(rows)), categories_, ordered_);
}

// =============================================================================
// NullableArray
// =============================================================================

NullableArray::NullableArray(DenseArray values, std::optional<DenseArray> mask)
    : kind_(NullableKind::Integer), values_(std::move(values)), mask_(std::move(mask))
{
    if (values_.dtype() == DType::Bool) {
        kind_ = NullableKind::Boolean;
    } else if (!is_integer(values_.dtype())) {
        throw TypeError(std::string("nullable arrays hold integers or booleans, got ") +
                        dtype_name(values_.dtype()));
    }
    if (mask_) {
        if (mask_->dtype() != DType::Bool) {
            throw TypeError("nullable array mask must be boolean");
        }
        CELIO_CHECK_DIM(mask_->shape() == values_.shape(),
                        "nullable array mask shape does not match values");
    }
}

bool NullableArray::is_valid(Size i) const {
    CELIO_CHECK_BOUNDS(static_cast<Index>(i), size(), "NullableArray::is_valid: index out of range");
    return !mask_ || !mask_->values<bool>()[i];
}

NullableArray NullableArray::take(const AxisSelector& rows) const {
    std::optional<DenseArray> mask;
    if (mask_) mask = mask_->take(axis0(rows));
    return NullableArray(values_.take(axis0(rows)), std::move(mask));
}

bool operator==(const NullableArray& a, const NullableArray& b) {
    if (a.kind_ != b.kind_ || a.values_.shape() != b.values_.shape()) return false;
    if (a.has_mask() != b.has_mask()) return false;
    if (!a.has_mask()) return a.values_ == b.values_;

    if (*a.mask_ != *b.mask_) return false;
    // masked slots carry no value
    for (Size i = 0; i < a.size(); ++i) {
        if (!a.is_valid(i)) continue;
        if (a.values_.as_index(i) != b.values_.as_index(i)) return false;
    }
    return a.values_.dtype() == b.values_.dtype();
}

// =============================================================================
// Scalar
// =============================================================================

Scalar::Scalar(DenseArray value)
    : value_(std::move(value))
{
    CELIO_CHECK_DIM(value_.is_scalar(), "Scalar requires a zero-dimensional array");
    if (is_text(value_.dtype())) {
        throw TypeError("Scalar holds numeric values only; use std::string for text");
    }
}

} // namespace celio
