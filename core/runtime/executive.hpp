// ==============================================================================
// Executive
// ==============================================================================
// The executive runs a loaded program. It:
// - Loads program listings into an Executable and sizes runtime memory
// - Bounces through code blocks, executing their graph nodes in order
// - Skips clean graph nodes when delta execution is on
// - Tracks the running block and the debug stack-frame flags that the
//   mirror consults during name resolution
//
// Execution is synchronous. A bounce runs a block's statements, then its
// nested language and construct blocks; function bodies run only when
// entered through a frame.
// ==============================================================================

#ifndef DSMIRROR_RUNTIME_EXECUTIVE_HPP
#define DSMIRROR_RUNTIME_EXECUTIVE_HPP

#include "executable.hpp"
#include "options.hpp"
#include "runtime_memory.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace dsm {

// ==============================================================================
// Debug Properties
// ==============================================================================

/**
 * @brief Debugger-visible execution flags
 */
struct DebugProperties {
    enum StackFrameFlag : unsigned {
        // Paused inside a function entered through its entry point; name
        // resolution must use the top frame's class and function scopes
        FEP_RUN = 1u << 0
    };

    unsigned flags = 0;

    bool debug_stack_frame_contains(StackFrameFlag flag) const {
        return (flags & flag) != 0;
    }

    void set_flag(StackFrameFlag flag, bool on) {
        if (on) {
            flags |= flag;
        } else {
            flags &= ~static_cast<unsigned>(flag);
        }
    }
};

// ==============================================================================
// Execution Statistics
// ==============================================================================

struct ExecutiveStats {
    uint64_t nodes_executed = 0;   // graph nodes evaluated
    uint64_t nodes_skipped = 0;    // clean graph nodes skipped by delta execution
    uint64_t bounces = 0;          // code blocks entered

    void reset() {
        nodes_executed = 0;
        nodes_skipped = 0;
        bounces = 0;
    }
};

// ==============================================================================
// Executive Class
// ==============================================================================

/**
 * @brief The program executive
 *
 * Basic usage:
 *   Executive executive;
 *   executive.load_string("a = 5\nb = a + 1\n");
 *   executive.execute();
 *
 * Debugging usage:
 *   executive.enter_function_frame(method_id, receiver);
 *   executive.set_running_block(2);
 *   ExecutionMirror mirror(executive);
 *   Obj x = mirror.get_debug_value("x");
 */
class Executive {
public:
    explicit Executive(RuntimeOptions options = RuntimeOptions{});

    // =========================================================================
    // Program Loading
    // =========================================================================

    /**
     * @brief Load a program listing from a file
     *
     * @throws FileError if the file cannot be read
     * @throws ParseError if the listing is invalid
     */
    void load_file(const std::string& file_path);

    /**
     * @brief Load a program listing from a string
     */
    void load_string(const std::string& source, const std::string& name = "<string>");

    /**
     * @brief Clear memory and mark every graph node dirty
     *
     * The loaded program is kept.
     */
    void reset();

    // =========================================================================
    // Execution
    // =========================================================================

    /**
     * @brief Bounce every top-level code block once
     *
     * @throws RuntimeError if evaluation fails
     */
    void execute();

    /**
     * @brief Run one code block inside a new frame
     *
     * The frame is popped again on every exit path.
     */
    void bounce(int block_id, StackFrame frame);

    /**
     * @brief Push a frame for a procedure, as if paused at its entry point
     *
     * Reserves the procedure's local slots and sets the FEP_RUN flag.
     *
     * @throws RuntimeError for an unknown procedure
     */
    void enter_function_frame(int procedure_id, const StackValue& this_ptr = NullValue{});

    /**
     * @brief Pop the frame pushed by enter_function_frame
     *
     * FEP_RUN is cleared once no function frame remains.
     */
    void leave_function_frame();

    /**
     * @brief Evaluate an expression as if it appeared in block_id
     */
    StackValue evaluate(const Expr& expr, int block_id);

    // =========================================================================
    // State Inspection
    // =========================================================================

    /**
     * @brief Block currently executing, or where a debugger paused
     */
    int running_block() const { return running_block_; }

    void set_running_block(int block_id);

    bool is_loaded() const { return executable_ != nullptr; }

    /**
     * @throws RuntimeError if no program is loaded
     */
    const Executable& executable() const;
    Executable& executable();

    const RuntimeMemory& memory() const { return memory_; }
    RuntimeMemory& memory() { return memory_; }

    const RuntimeOptions& options() const { return options_; }
    RuntimeOptions& options() { return options_; }

    const DebugProperties& debug_properties() const { return debug_properties_; }
    DebugProperties& debug_properties() { return debug_properties_; }

    const ExecutiveStats& get_stats() const { return stats_; }
    void reset_stats() { stats_.reset(); }

private:
    std::unique_ptr<Executable> executable_;
    std::string source_name_;
    RuntimeMemory memory_;
    RuntimeOptions options_;
    DebugProperties debug_properties_;
    ExecutiveStats stats_;

    int running_block_ = Constants::ROOT_BLOCK;
    int function_frame_depth_ = 0;

    // =========================================================================
    // Execution Helpers
    // =========================================================================

    void install(std::unique_ptr<Executable> executable, const std::string& name);

    /**
     * @brief Execute a block's statements, then its non-function children
     */
    void run_block(CodeBlock& block);

    void execute_node(GraphNode& node);

    /**
     * @brief Find the symbol a name refers to from inside block_id
     *
     * @return The symbol, or nullptr if no enclosing block declares it
     */
    const SymbolNode* resolve_read(const std::string& name, int block_id) const;

    StackValue evaluate_binary(BinaryOperator op, const StackValue& lhs,
                               const StackValue& rhs, LineNumber line);
};

}  // namespace dsm

#endif  // DSMIRROR_RUNTIME_EXECUTIVE_HPP
