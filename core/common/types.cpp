// ==============================================================================
// Common Type Implementations
// ==============================================================================

#include "types.hpp"

namespace dsm {

const char* address_type_to_string(AddressType type) {
    switch (type) {
        case AddressType::INVALID:            return "INVALID";
        case AddressType::NULL_VALUE:         return "NULL";
        case AddressType::INT:                return "INT";
        case AddressType::DOUBLE:             return "DOUBLE";
        case AddressType::BOOLEAN:            return "BOOLEAN";
        case AddressType::CHAR:               return "CHAR";
        case AddressType::STRING:             return "STRING";
        case AddressType::POINTER:            return "POINTER";
        case AddressType::ARRAY_POINTER:      return "ARRAY_POINTER";
        case AddressType::FUNCTION_POINTER:   return "FUNCTION_POINTER";
        case AddressType::DEFAULT_ARG:        return "DEFAULT_ARG";
        case AddressType::BLOCK_INDEX:        return "BLOCK_INDEX";
        case AddressType::CALLING_CONVENTION: return "CALLING_CONVENTION";
        default:                              return "UNKNOWN";
    }
}

const char* primitive_type_to_string(PrimitiveType type) {
    switch (type) {
        case PrimitiveType::VOID:             return "void";
        case PrimitiveType::NULL_TYPE:        return "null";
        case PrimitiveType::VAR:              return "var";
        case PrimitiveType::INT:              return "int";
        case PrimitiveType::DOUBLE:           return "double";
        case PrimitiveType::BOOL:             return "bool";
        case PrimitiveType::CHAR:             return "char";
        case PrimitiveType::STRING:           return "string";
        case PrimitiveType::ARRAY:            return "array";
        case PrimitiveType::POINTER:          return "pointer";
        case PrimitiveType::FUNCTION_POINTER: return "function";
        default:                              return "unknown";
    }
}

}  // namespace dsm
