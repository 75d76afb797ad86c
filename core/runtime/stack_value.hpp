// ==============================================================================
// Stack Value Representation
// ==============================================================================
// This file defines how we represent one runtime value: the content of a
// global stack slot, a frame local, an array element or an object field.
// Each value kind is its own struct, and StackValue is a closed variant over
// all of them, so every consumer that dispatches on the kind is checked for
// exhaustiveness by the compiler.
// ==============================================================================

#ifndef DSMIRROR_RUNTIME_STACK_VALUE_HPP
#define DSMIRROR_RUNTIME_STACK_VALUE_HPP

#include "types.hpp"
#include <string>
#include <variant>
#include <optional>

namespace dsm {

// ==============================================================================
// Immediate Values
// ==============================================================================

/**
 * @brief A slot that was declared but never assigned
 */
struct InvalidValue {
    bool operator==(const InvalidValue&) const { return true; }
};

struct NullValue {
    bool operator==(const NullValue&) const { return true; }
};

struct IntValue {
    int64_t value;

    bool operator==(const IntValue& other) const { return value == other.value; }
};

struct DoubleValue {
    double value;

    bool operator==(const DoubleValue& other) const { return value == other.value; }
};

struct BoolValue {
    bool value;

    bool operator==(const BoolValue& other) const { return value == other.value; }
};

struct CharValue {
    char value;

    bool operator==(const CharValue& other) const { return value == other.value; }
};

// ==============================================================================
// Heap References
// ==============================================================================

/**
 * @brief Handle of a boxed string on the heap
 */
struct StringValue {
    HeapHandle handle;

    bool operator==(const StringValue& other) const { return handle == other.handle; }
};

/**
 * @brief Handle of a class instance, tagged with its class id
 *
 * class_type indexes the ClassTable. Ids below MAX_PRIMITIVES are built-in
 * wrapper classes.
 */
struct PointerValue {
    HeapHandle handle;
    int class_type;

    bool operator==(const PointerValue& other) const {
        return handle == other.handle && class_type == other.class_type;
    }
};

/**
 * @brief Handle of an array (positional elements plus keyed entries)
 */
struct ArrayPointerValue {
    HeapHandle handle;

    bool operator==(const ArrayPointerValue& other) const { return handle == other.handle; }
};

/**
 * @brief Index into the procedure table
 */
struct FunctionPointerValue {
    int procedure_id;

    bool operator==(const FunctionPointerValue& other) const {
        return procedure_id == other.procedure_id;
    }
};

// ==============================================================================
// VM Register Kinds
// ==============================================================================
// These never hold user data. They show up in frame registers and argument
// lists, and the mirror refuses to unpack them.

struct DefaultArgValue {
    bool operator==(const DefaultArgValue&) const { return true; }
};

struct BlockIndexValue {
    int block_id;

    bool operator==(const BlockIndexValue& other) const { return block_id == other.block_id; }
};

/**
 * @brief How a code block was entered
 *
 * IMPLICIT marks a bounce issued by the runtime itself (re-execution after
 * set_value_and_execute) rather than by program control flow.
 */
enum class BounceType {
    EXPLICIT,
    IMPLICIT
};

struct CallingConventionValue {
    BounceType bounce_type;

    bool operator==(const CallingConventionValue& other) const {
        return bounce_type == other.bounce_type;
    }
};

// ==============================================================================
// StackValue - Unified Value Type
// ==============================================================================

/**
 * @brief A single runtime value (any kind)
 *
 * Usage:
 *   StackValue v = IntValue{42};
 *   if (auto* i = std::get_if<IntValue>(&v)) {
 *       // use i->value
 *   }
 *
 * Code that must handle every kind uses std::visit with an if-constexpr
 * chain terminated by static_assert(always_false_v<T>), so adding a kind
 * here breaks the build until every match handles it.
 */
using StackValue = std::variant<
    InvalidValue,
    NullValue,
    IntValue,
    DoubleValue,
    BoolValue,
    CharValue,
    StringValue,
    PointerValue,
    ArrayPointerValue,
    FunctionPointerValue,
    DefaultArgValue,
    BlockIndexValue,
    CallingConventionValue
>;

template<typename>
inline constexpr bool always_false_v = false;

// ==============================================================================
// Helper Functions
// ==============================================================================

/**
 * @brief Kind tag of a value
 */
AddressType get_address_type(const StackValue& value);

/**
 * @brief Heap handle of a string, object or array value
 *
 * @return std::nullopt for values that do not live on the heap
 */
std::optional<HeapHandle> get_heap_handle(const StackValue& value);

inline bool is_invalid(const StackValue& value) {
    return std::holds_alternative<InvalidValue>(value);
}

inline bool is_null(const StackValue& value) {
    return std::holds_alternative<NullValue>(value);
}

inline bool is_pointer(const StackValue& value) {
    return std::holds_alternative<PointerValue>(value);
}

inline bool is_array(const StackValue& value) {
    return std::holds_alternative<ArrayPointerValue>(value);
}

/**
 * @brief Convert a value to a short diagnostic string
 *
 * Example: PointerValue{3, 12} -> "POINTER(3, class 12)"
 */
std::string stack_value_to_string(const StackValue& value);

}  // namespace dsm

#endif  // DSMIRROR_RUNTIME_STACK_VALUE_HPP
