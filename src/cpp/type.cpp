#include "celio/core/type.hpp"

namespace celio {

const char* dtype_name(DType d) noexcept {
    switch (d) {
        case DType::Bool:    return "bool";
        case DType::Int8:    return "int8";
        case DType::Int16:   return "int16";
        case DType::Int32:   return "int32";
        case DType::Int64:   return "int64";
        case DType::UInt8:   return "uint8";
        case DType::UInt16:  return "uint16";
        case DType::UInt32:  return "uint32";
        case DType::UInt64:  return "uint64";
        case DType::Float32: return "float32";
        case DType::Float64: return "float64";
        case DType::String:  return "str";
        case DType::Object:  return "object";
    }
    return "unknown";
}

const char* element_kind_name(ElementKind k) noexcept {
    switch (k) {
        case ElementKind::Numeric: return "numeric";
        case ElementKind::Text:    return "unicode";
        case ElementKind::Object:  return "object";
        case ElementKind::Record:  return "record";
    }
    return "unknown";
}

} // namespace celio
