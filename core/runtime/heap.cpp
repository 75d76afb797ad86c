// ==============================================================================
// Heap Implementation
// ==============================================================================

#include "heap.hpp"
#include "error.hpp"

namespace dsm {

// ==============================================================================
// Allocation
// ==============================================================================

StringValue Heap::allocate_string(const std::string& value) {
    return StringValue{store(HeapString{value})};
}

ArrayPointerValue Heap::allocate_array(std::vector<StackValue> values,
                                       std::vector<std::pair<StackValue, StackValue>> keyed) {
    HeapArray array;
    array.values = std::move(values);
    array.keyed = std::move(keyed);
    return ArrayPointerValue{store(std::move(array))};
}

PointerValue Heap::allocate_object(int class_type, std::vector<StackValue> values) {
    HeapObject object;
    object.class_type = class_type;
    object.values = std::move(values);
    return PointerValue{store(std::move(object)), class_type};
}

void Heap::clear() {
    entries_.clear();
}

HeapHandle Heap::store(HeapEntry entry) {
    HeapHandle handle = next_handle_++;
    entries_.emplace(handle, std::move(entry));
    return handle;
}

// ==============================================================================
// Typed Access
// ==============================================================================

const HeapEntry& Heap::lookup(const StackValue& value, const char* expected) const {
    auto handle = get_heap_handle(value);
    if (!handle) {
        throw RuntimeError(build_error_message(
            "Expected a ", expected, " reference, got ", stack_value_to_string(value)));
    }

    auto it = entries_.find(*handle);
    if (it == entries_.end()) {
        throw RuntimeError(build_error_message(
            "Dangling heap handle ", *handle, " (expected a ", expected, ")"));
    }
    return it->second;
}

HeapEntry& Heap::lookup(const StackValue& value, const char* expected) {
    const Heap& self = *this;
    return const_cast<HeapEntry&>(self.lookup(value, expected));
}

const HeapString& Heap::to_string(const StackValue& value) const {
    const HeapEntry& entry = lookup(value, "string");
    if (auto* str = std::get_if<HeapString>(&entry)) {
        return *str;
    }
    throw RuntimeError("Heap object " + stack_value_to_string(value) + " is not a string");
}

const HeapArray& Heap::to_array(const StackValue& value) const {
    const HeapEntry& entry = lookup(value, "array");
    if (auto* array = std::get_if<HeapArray>(&entry)) {
        return *array;
    }
    throw RuntimeError("Heap object " + stack_value_to_string(value) + " is not an array");
}

HeapArray& Heap::to_array(const StackValue& value) {
    HeapEntry& entry = lookup(value, "array");
    if (auto* array = std::get_if<HeapArray>(&entry)) {
        return *array;
    }
    throw RuntimeError("Heap object " + stack_value_to_string(value) + " is not an array");
}

const HeapObject& Heap::to_object(const StackValue& value) const {
    const HeapEntry& entry = lookup(value, "object");
    if (auto* object = std::get_if<HeapObject>(&entry)) {
        return *object;
    }
    throw RuntimeError("Heap object " + stack_value_to_string(value) + " is not a class instance");
}

HeapObject& Heap::to_object(const StackValue& value) {
    HeapEntry& entry = lookup(value, "object");
    if (auto* object = std::get_if<HeapObject>(&entry)) {
        return *object;
    }
    throw RuntimeError("Heap object " + stack_value_to_string(value) + " is not a class instance");
}

void Heap::set_array_element(const ArrayPointerValue& array, size_t index,
                             const StackValue& value) {
    HeapArray& target = to_array(array);
    if (index >= target.values.size()) {
        target.values.resize(index + 1, NullValue{});
    }
    target.values[index] = value;
}

void Heap::set_keyed_element(const ArrayPointerValue& array, const StackValue& key,
                             const StackValue& value) {
    HeapArray& target = to_array(array);
    for (auto& entry : target.keyed) {
        if (keys_equal(entry.first, key)) {
            entry.second = value;
            return;
        }
    }
    target.keyed.emplace_back(key, value);
}

// String keys compare by content, everything else by value
bool Heap::keys_equal(const StackValue& lhs, const StackValue& rhs) const {
    if (std::holds_alternative<StringValue>(lhs) && std::holds_alternative<StringValue>(rhs)) {
        return to_string(lhs).value == to_string(rhs).value;
    }
    return lhs == rhs;
}

}  // namespace dsm
