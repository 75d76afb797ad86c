// ==============================================================================
// Stack Value Helper Functions
// ==============================================================================

#include "stack_value.hpp"
#include <sstream>
#include <type_traits>

namespace dsm {

AddressType get_address_type(const StackValue& value) {
    return std::visit([](const auto& v) -> AddressType {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, InvalidValue>) {
            return AddressType::INVALID;
        } else if constexpr (std::is_same_v<T, NullValue>) {
            return AddressType::NULL_VALUE;
        } else if constexpr (std::is_same_v<T, IntValue>) {
            return AddressType::INT;
        } else if constexpr (std::is_same_v<T, DoubleValue>) {
            return AddressType::DOUBLE;
        } else if constexpr (std::is_same_v<T, BoolValue>) {
            return AddressType::BOOLEAN;
        } else if constexpr (std::is_same_v<T, CharValue>) {
            return AddressType::CHAR;
        } else if constexpr (std::is_same_v<T, StringValue>) {
            return AddressType::STRING;
        } else if constexpr (std::is_same_v<T, PointerValue>) {
            return AddressType::POINTER;
        } else if constexpr (std::is_same_v<T, ArrayPointerValue>) {
            return AddressType::ARRAY_POINTER;
        } else if constexpr (std::is_same_v<T, FunctionPointerValue>) {
            return AddressType::FUNCTION_POINTER;
        } else if constexpr (std::is_same_v<T, DefaultArgValue>) {
            return AddressType::DEFAULT_ARG;
        } else if constexpr (std::is_same_v<T, BlockIndexValue>) {
            return AddressType::BLOCK_INDEX;
        } else if constexpr (std::is_same_v<T, CallingConventionValue>) {
            return AddressType::CALLING_CONVENTION;
        } else {
            static_assert(always_false_v<T>, "unhandled value kind");
        }
    }, value);
}

std::optional<HeapHandle> get_heap_handle(const StackValue& value) {
    if (auto* s = std::get_if<StringValue>(&value)) return s->handle;
    if (auto* p = std::get_if<PointerValue>(&value)) return p->handle;
    if (auto* a = std::get_if<ArrayPointerValue>(&value)) return a->handle;
    return std::nullopt;
}

std::string stack_value_to_string(const StackValue& value) {
    std::ostringstream oss;
    oss << address_type_to_string(get_address_type(value));

    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, IntValue> || std::is_same_v<T, DoubleValue>) {
            oss << "(" << v.value << ")";
        } else if constexpr (std::is_same_v<T, BoolValue>) {
            oss << "(" << (v.value ? "true" : "false") << ")";
        } else if constexpr (std::is_same_v<T, CharValue>) {
            oss << "('" << v.value << "')";
        } else if constexpr (std::is_same_v<T, StringValue> ||
                             std::is_same_v<T, ArrayPointerValue>) {
            oss << "(" << v.handle << ")";
        } else if constexpr (std::is_same_v<T, PointerValue>) {
            oss << "(" << v.handle << ", class " << v.class_type << ")";
        } else if constexpr (std::is_same_v<T, FunctionPointerValue>) {
            oss << "(" << v.procedure_id << ")";
        } else if constexpr (std::is_same_v<T, BlockIndexValue>) {
            oss << "(" << v.block_id << ")";
        } else if constexpr (std::is_same_v<T, CallingConventionValue>) {
            oss << (v.bounce_type == BounceType::IMPLICIT ? "(implicit)" : "(explicit)");
        }
    }, value);

    return oss.str();
}

}  // namespace dsm
