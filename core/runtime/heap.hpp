// ==============================================================================
// Heap
// ==============================================================================
// Owns every boxed runtime object: strings, arrays and class instances. Values
// on the stack refer to heap objects by HeapHandle. Handles are never reused,
// so a stale handle is always detected instead of aliasing a newer object.
//
// Arrays have two parts: positional elements (index 0..count-1) and keyed
// entries for non-integer keys, kept in insertion order.
// ==============================================================================

#ifndef DSMIRROR_RUNTIME_HEAP_HPP
#define DSMIRROR_RUNTIME_HEAP_HPP

#include "stack_value.hpp"
#include <string>
#include <vector>
#include <utility>
#include <unordered_map>
#include <variant>

namespace dsm {

// ==============================================================================
// Heap Objects
// ==============================================================================

struct HeapString {
    std::string value;
};

struct HeapArray {
    std::vector<StackValue> values;
    std::vector<std::pair<StackValue, StackValue>> keyed;

    size_t count() const { return values.size(); }
};

struct HeapObject {
    int class_type;
    std::vector<StackValue> values;

    size_t count() const { return values.size(); }
};

using HeapEntry = std::variant<HeapString, HeapArray, HeapObject>;

// ==============================================================================
// Heap Class
// ==============================================================================

class Heap {
public:
    Heap() = default;

    // =========================================================================
    // Allocation
    // =========================================================================

    StringValue allocate_string(const std::string& value);

    ArrayPointerValue allocate_array(std::vector<StackValue> values,
                                     std::vector<std::pair<StackValue, StackValue>> keyed = {});

    PointerValue allocate_object(int class_type, std::vector<StackValue> values);

    /**
     * @brief Release every object
     *
     * Handles are not reset, so values captured before clear() stay invalid.
     */
    void clear();

    // =========================================================================
    // Typed Access
    // =========================================================================
    // Each accessor throws RuntimeError if the handle is dangling or names an
    // object of a different kind.

    const HeapString& to_string(const StackValue& value) const;
    const HeapArray& to_array(const StackValue& value) const;
    HeapArray& to_array(const StackValue& value);
    const HeapObject& to_object(const StackValue& value) const;
    HeapObject& to_object(const StackValue& value);

    /**
     * @brief Store an element at a positional index
     *
     * The array grows as needed; new slots in between are null.
     */
    void set_array_element(const ArrayPointerValue& array, size_t index,
                           const StackValue& value);

    /**
     * @brief Store a keyed entry, replacing an existing one with an equal key
     */
    void set_keyed_element(const ArrayPointerValue& array, const StackValue& key,
                           const StackValue& value);

    // =========================================================================
    // Inspection
    // =========================================================================

    bool contains(HeapHandle handle) const { return entries_.count(handle) > 0; }

    size_t size() const { return entries_.size(); }

private:
    std::unordered_map<HeapHandle, HeapEntry> entries_;
    HeapHandle next_handle_ = 1;

    HeapHandle store(HeapEntry entry);
    const HeapEntry& lookup(const StackValue& value, const char* expected) const;
    HeapEntry& lookup(const StackValue& value, const char* expected);

    bool keys_equal(const StackValue& lhs, const StackValue& rhs) const;
};

}  // namespace dsm

#endif  // DSMIRROR_RUNTIME_HEAP_HPP
