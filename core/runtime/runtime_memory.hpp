// ==============================================================================
// Runtime Memory
// ==============================================================================
// The runtime memory manages:
// - The global stack: one slot per global and static variable, followed by
//   the local slots of every active frame
// - The frame stack (one StackFrame per bounce or function call)
// - The heap (strings, arrays, class instances)
//
// Stack Layout:
//   0 .. global_size-1:   globals and class statics (fixed at load time)
//   frame_base + i:       local i of the frame that reserved it
// ==============================================================================

#ifndef DSMIRROR_RUNTIME_RUNTIME_MEMORY_HPP
#define DSMIRROR_RUNTIME_RUNTIME_MEMORY_HPP

#include "heap.hpp"
#include "stack_value.hpp"
#include "symbol_node.hpp"
#include <string>
#include <vector>

namespace dsm {

// ==============================================================================
// Stack Frame - Scope Identity of the Running Code
// ==============================================================================

/**
 * @brief Record of the currently executing code
 *
 * Name resolution consults the top frame to learn which class and function
 * it is paused in. A bounce into a top-level block pushes a frame with
 * global scopes; a function call pushes one with the callee's scopes.
 */
struct StackFrame {
    int class_scope = Constants::INVALID_INDEX;
    int function_scope = Constants::GLOBAL_SCOPE;
    int function_block = Constants::GLOBAL_SCOPE;

    // First local slot of this frame in the global stack
    int frame_base = 0;
    int local_count = 0;

    // The receiver of a method call, null otherwise
    StackValue this_ptr = NullValue{};

    // Calling convention register: how this frame was entered
    StackValue tx = CallingConventionValue{BounceType::EXPLICIT};
};

// ==============================================================================
// Runtime Memory Class
// ==============================================================================

class RuntimeMemory {
public:
    RuntimeMemory() = default;

    /**
     * @brief Clear the stack, the frames and the heap
     */
    void reset();

    /**
     * @brief Size the global area
     *
     * Slots start out INVALID (declared, never assigned).
     *
     * @throws RuntimeError if frames are active
     */
    void allocate_globals(int global_size);

    int global_size() const { return global_size_; }

    // =========================================================================
    // Frames
    // =========================================================================

    /**
     * @brief Push a frame and reserve its local slots
     *
     * Sets frame.frame_base; local slots start out INVALID.
     */
    void push_frame(StackFrame frame, int local_count);

    /**
     * @brief Pop the top frame and release its local slots
     *
     * @throws RuntimeError if no frame is active
     */
    void pop_frame();

    /**
     * @brief The top frame
     *
     * @throws RuntimeError if no frame is active
     */
    const StackFrame& current_frame() const;

    bool has_frame() const { return !frames_.empty(); }

    const std::vector<StackFrame>& frames() const { return frames_; }

    // =========================================================================
    // Symbol Access
    // =========================================================================

    /**
     * @brief Read a variable's slot
     *
     * Globals and static fields live in the global area; function locals
     * and arguments are relative to the top frame.
     *
     * @throws RuntimeError for an out-of-range slot, or a local without a frame
     */
    StackValue get_symbol_value(const SymbolNode& symbol) const;

    void set_symbol_value(const SymbolNode& symbol, const StackValue& value);

    /**
     * @brief Read a class field as seen from the top frame
     *
     * Static fields come from their global slot; instance fields come from
     * the frame's this pointer.
     *
     * @throws RuntimeError if the frame has no usable this pointer
     */
    StackValue get_member_data(const SymbolNode& field) const;

    /**
     * @brief Read a global slot by absolute index
     */
    StackValue get_at_relative(int index) const;

    void set_at_relative(int index, const StackValue& value);

    const std::vector<StackValue>& stack() const { return stack_; }

    // =========================================================================
    // Heap
    // =========================================================================

    const Heap& heap() const { return heap_; }
    Heap& heap() { return heap_; }

    /**
     * @brief Dump memory state for debugging
     */
    std::string dump_state() const;

private:
    std::vector<StackValue> stack_;
    std::vector<StackFrame> frames_;
    Heap heap_;
    int global_size_ = 0;

    static bool is_frame_relative(const SymbolNode& symbol);
    int slot_of(const SymbolNode& symbol) const;
};

}  // namespace dsm

#endif  // DSMIRROR_RUNTIME_RUNTIME_MEMORY_HPP
