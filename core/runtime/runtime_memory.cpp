// ==============================================================================
// Runtime Memory Implementation
// ==============================================================================

#include "runtime_memory.hpp"
#include "error.hpp"
#include <sstream>

namespace dsm {

// ==============================================================================
// Initialization
// ==============================================================================

void RuntimeMemory::reset() {
    stack_.clear();
    frames_.clear();
    heap_.clear();
    global_size_ = 0;
}

void RuntimeMemory::allocate_globals(int global_size) {
    if (!frames_.empty()) {
        throw RuntimeError("Cannot resize the global area while frames are active");
    }
    global_size_ = global_size;
    stack_.assign(static_cast<size_t>(global_size), InvalidValue{});
}

// ==============================================================================
// Frames
// ==============================================================================

void RuntimeMemory::push_frame(StackFrame frame, int local_count) {
    frame.frame_base = static_cast<int>(stack_.size());
    frame.local_count = local_count;
    stack_.resize(stack_.size() + static_cast<size_t>(local_count), InvalidValue{});
    frames_.push_back(std::move(frame));
}

void RuntimeMemory::pop_frame() {
    if (frames_.empty()) {
        throw RuntimeError(
            "Frame stack underflow! Attempted to leave a frame that was never entered.");
    }
    stack_.resize(static_cast<size_t>(frames_.back().frame_base));
    frames_.pop_back();
}

const StackFrame& RuntimeMemory::current_frame() const {
    if (frames_.empty()) {
        throw RuntimeError("No active stack frame");
    }
    return frames_.back();
}

// ==============================================================================
// Symbol Access
// ==============================================================================

bool RuntimeMemory::is_frame_relative(const SymbolNode& symbol) {
    return symbol.function_index != Constants::GLOBAL_SCOPE && !symbol.is_static;
}

int RuntimeMemory::slot_of(const SymbolNode& symbol) const {
    int slot = symbol.memory_index;
    if (is_frame_relative(symbol)) {
        if (frames_.empty()) {
            throw RuntimeError("Local '" + symbol.name + "' read outside any frame");
        }
        const StackFrame& frame = frames_.back();
        if (slot < 0 || slot >= frame.local_count) {
            throw RuntimeError(build_error_message(
                "Local '", symbol.name, "' slot ", slot, " is outside the current frame (",
                frame.local_count, " locals)"));
        }
        slot += frame.frame_base;
    }

    if (slot < 0 || slot >= static_cast<int>(stack_.size())) {
        throw RuntimeError(build_error_message(
            "Symbol '", symbol.name, "' has no stack slot (index ", slot, ")"));
    }
    return slot;
}

StackValue RuntimeMemory::get_symbol_value(const SymbolNode& symbol) const {
    return stack_[slot_of(symbol)];
}

void RuntimeMemory::set_symbol_value(const SymbolNode& symbol, const StackValue& value) {
    stack_[slot_of(symbol)] = value;
}

StackValue RuntimeMemory::get_member_data(const SymbolNode& field) const {
    if (field.is_static) {
        return get_at_relative(field.memory_index);
    }

    const StackFrame& frame = current_frame();
    if (!is_pointer(frame.this_ptr)) {
        throw RuntimeError("Field '" + field.name + "' read without a receiver object");
    }

    const HeapObject& object = heap_.to_object(frame.this_ptr);
    if (field.memory_index < 0 || field.memory_index >= static_cast<int>(object.count())) {
        throw RuntimeError(build_error_message(
            "Field '", field.name, "' slot ", field.memory_index,
            " is outside the receiver object"));
    }
    return object.values[field.memory_index];
}

StackValue RuntimeMemory::get_at_relative(int index) const {
    if (index < 0 || index >= global_size_) {
        throw RuntimeError(build_error_message(
            "Global slot ", index, " out of bounds (", global_size_, " globals)"));
    }
    return stack_[index];
}

void RuntimeMemory::set_at_relative(int index, const StackValue& value) {
    if (index < 0 || index >= global_size_) {
        throw RuntimeError(build_error_message(
            "Global slot ", index, " out of bounds (", global_size_, " globals)"));
    }
    stack_[index] = value;
}

// ==============================================================================
// Debugging Support
// ==============================================================================

std::string RuntimeMemory::dump_state() const {
    std::ostringstream oss;
    oss << "=== Runtime Memory ===\n";
    oss << "Globals: " << global_size_ << "  Frames: " << frames_.size()
        << "  Heap objects: " << heap_.size() << "\n";

    for (int i = 0; i < global_size_; i++) {
        oss << "  [" << i << "] " << stack_value_to_string(stack_[i]) << "\n";
    }

    for (size_t f = 0; f < frames_.size(); f++) {
        const StackFrame& frame = frames_[f];
        oss << "Frame " << f << ": class " << frame.class_scope
            << ", function " << frame.function_scope
            << ", block " << frame.function_block
            << ", " << frame.local_count << " locals\n";
    }

    return oss.str();
}

}  // namespace dsm
