#pragma once

#include "celio/config.hpp"
#include "celio/core/macros.hpp"
#include "celio/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

// =============================================================================
// FILE: celio/core/type.hpp
// BRIEF: Element dtypes and element-kind classification
// =============================================================================

namespace celio {

// =============================================================================
// SECTION 1: Basic Types
// =============================================================================

using Size = std::size_t;
using Index = std::int64_t;
using Byte = std::uint8_t;

// =============================================================================
// SECTION 2: DType
// =============================================================================

enum class DType : std::uint8_t {
    Bool,
    Int8,
    Int16,
    Int32,
    Int64,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Float32,
    Float64,
    String,     // UTF-8 text
    Object,     // opaque objects; in this closed model they carry text
};

/// Coarse category of an array's contained values, used to refine writer
/// dispatch for array-like values.
enum class ElementKind : std::uint8_t {
    Numeric,
    Text,
    Object,
    Record,
};

[[nodiscard]] constexpr bool is_text(DType d) noexcept {
    return d == DType::String || d == DType::Object;
}

[[nodiscard]] constexpr bool is_floating(DType d) noexcept {
    return d == DType::Float32 || d == DType::Float64;
}

[[nodiscard]] constexpr bool is_signed_integer(DType d) noexcept {
    return d == DType::Int8 || d == DType::Int16 || d == DType::Int32 || d == DType::Int64;
}

[[nodiscard]] constexpr bool is_unsigned_integer(DType d) noexcept {
    return d == DType::UInt8 || d == DType::UInt16 || d == DType::UInt32 || d == DType::UInt64;
}

[[nodiscard]] constexpr bool is_integer(DType d) noexcept {
    return is_signed_integer(d) || is_unsigned_integer(d);
}

/// Byte width of one element; text dtypes have no fixed width and report 0.
[[nodiscard]] constexpr Size dtype_size(DType d) noexcept {
    switch (d) {
        case DType::Bool:
        case DType::Int8:
        case DType::UInt8:   return 1;
        case DType::Int16:
        case DType::UInt16:  return 2;
        case DType::Int32:
        case DType::UInt32:
        case DType::Float32: return 4;
        case DType::Int64:
        case DType::UInt64:
        case DType::Float64: return 8;
        case DType::String:
        case DType::Object:  return 0;
    }
    return 0;
}

[[nodiscard]] constexpr ElementKind element_kind(DType d) noexcept {
    switch (d) {
        case DType::String: return ElementKind::Text;
        case DType::Object: return ElementKind::Object;
        default:            return ElementKind::Numeric;
    }
}

[[nodiscard]] const char* dtype_name(DType d) noexcept;
[[nodiscard]] const char* element_kind_name(ElementKind k) noexcept;

// =============================================================================
// SECTION 3: C++ Type <-> DType Mapping
// =============================================================================

template <typename T>
struct dtype_of;

template <> struct dtype_of<bool>          { static constexpr DType value = DType::Bool; };
template <> struct dtype_of<std::int8_t>   { static constexpr DType value = DType::Int8; };
template <> struct dtype_of<std::int16_t>  { static constexpr DType value = DType::Int16; };
template <> struct dtype_of<std::int32_t>  { static constexpr DType value = DType::Int32; };
template <> struct dtype_of<std::int64_t>  { static constexpr DType value = DType::Int64; };
template <> struct dtype_of<std::uint8_t>  { static constexpr DType value = DType::UInt8; };
template <> struct dtype_of<std::uint16_t> { static constexpr DType value = DType::UInt16; };
template <> struct dtype_of<std::uint32_t> { static constexpr DType value = DType::UInt32; };
template <> struct dtype_of<std::uint64_t> { static constexpr DType value = DType::UInt64; };
template <> struct dtype_of<float>         { static constexpr DType value = DType::Float32; };
template <> struct dtype_of<double>        { static constexpr DType value = DType::Float64; };
template <> struct dtype_of<std::string>   { static constexpr DType value = DType::String; };

template <typename T>
inline constexpr DType dtype_of_v = dtype_of<T>::value;

template <typename T>
concept NumericElement = std::is_arithmetic_v<T> && requires { dtype_of<T>::value; };

/// Invoke `f` with a value-initialised instance of the C++ type matching a
/// numeric dtype. Text dtypes raise TypeError.
template <typename F>
decltype(auto) visit_numeric(DType d, F&& f) {
    switch (d) {
        case DType::Bool:    return f(bool{});
        case DType::Int8:    return f(std::int8_t{});
        case DType::Int16:   return f(std::int16_t{});
        case DType::Int32:   return f(std::int32_t{});
        case DType::Int64:   return f(std::int64_t{});
        case DType::UInt8:   return f(std::uint8_t{});
        case DType::UInt16:  return f(std::uint16_t{});
        case DType::UInt32:  return f(std::uint32_t{});
        case DType::UInt64:  return f(std::uint64_t{});
        case DType::Float32: return f(float{});
        case DType::Float64: return f(double{});
        default:             break;
    }
    throw TypeError(std::string("dtype '") + dtype_name(d) + "' is not numeric");
}

} // namespace celio
