#pragma once

#include "celio/core/dense.hpp"

#include <optional>
#include <string>
#include <vector>

// =============================================================================
// FILE: celio/core/column.hpp
// BRIEF: Leaf value shapes: categorical, nullable, scalar and byte string
// =============================================================================

namespace celio {

// =============================================================================
// Categorical
// =============================================================================

/// Codes into a categories array. A negative code marks a missing value.
class Categorical {
public:
    static constexpr Index kMissing = -1;

    Categorical();

    /// Throws ValueError when a code is neither missing nor a valid category index.
    Categorical(DenseArray codes, DenseArray categories, bool ordered = false);

    /// Encode text values; categories are the sorted distinct values.
    /// Entries equal to `missing` (if given) become the missing code.
    static Categorical from_values(const std::vector<std::string>& values,
                                   bool ordered = false,
                                   const std::optional<std::string>& missing = std::nullopt);

    [[nodiscard]] const DenseArray& codes() const noexcept { return codes_; }
    [[nodiscard]] const DenseArray& categories() const noexcept { return categories_; }
    [[nodiscard]] bool ordered() const noexcept { return ordered_; }
    [[nodiscard]] Size size() const noexcept { return codes_.size(); }

    [[nodiscard]] bool is_missing(Size i) const { return codes_.as_index(i) < 0; }

    /// Rows of the codes; categories are shared and never sliced.
    [[nodiscard]] Categorical take(const AxisSelector& rows) const;

    friend bool operator==(const Categorical& a, const Categorical& b) {
        return a.ordered_ == b.ordered_ && a.codes_ == b.codes_ &&
               a.categories_ == b.categories_;
    }

private:
    DenseArray codes_;
    DenseArray categories_;
    bool ordered_;
};

// =============================================================================
// NullableArray
// =============================================================================

enum class NullableKind : std::uint8_t {
    Integer,
    Boolean,
};

/// Integer or boolean values with an optional mask (true = missing).
/// Without a mask every value is valid.
class NullableArray {
public:
    explicit NullableArray(DenseArray values, std::optional<DenseArray> mask = std::nullopt);

    [[nodiscard]] NullableKind kind() const noexcept { return kind_; }
    [[nodiscard]] const DenseArray& values() const noexcept { return values_; }
    [[nodiscard]] const std::optional<DenseArray>& mask() const noexcept { return mask_; }
    [[nodiscard]] bool has_mask() const noexcept { return mask_.has_value(); }
    [[nodiscard]] Size size() const noexcept { return values_.size(); }

    [[nodiscard]] bool is_valid(Size i) const;

    [[nodiscard]] NullableArray take(const AxisSelector& rows) const;

    friend bool operator==(const NullableArray& a, const NullableArray& b);

private:
    NullableKind kind_;
    DenseArray values_;
    std::optional<DenseArray> mask_;
};

// =============================================================================
// Scalar
// =============================================================================

/// Zero-dimensional numeric value.
class Scalar {
public:
    template <NumericElement T>
    explicit Scalar(T v) : value_(DenseArray::scalar(v)) {}

    explicit Scalar(DenseArray value);

    [[nodiscard]] const DenseArray& value() const noexcept { return value_; }
    [[nodiscard]] DType dtype() const noexcept { return value_.dtype(); }
    [[nodiscard]] double as_double() const { return value_.as_double(0); }

    template <NumericElement T>
    [[nodiscard]] T get() const { return value_.values<T>()[0]; }

    friend bool operator==(const Scalar& a, const Scalar& b) { return a.value_ == b.value_; }

private:
    DenseArray value_;
};

// =============================================================================
// Bytes
// =============================================================================

/// Raw byte string, returned by the bytes encoding.
struct Bytes {
    std::string data;

    friend bool operator==(const Bytes& a, const Bytes& b) { return a.data == b.data; }
};

} // namespace celio
