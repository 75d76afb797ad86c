// ==============================================================================
// Executable
// ==============================================================================
// Static metadata of a loaded program:
// - The code block tree (top-level program, nested language blocks,
//   construct blocks, function bodies)
// - One runtime SymbolTable per code block
// - The class table and the procedure table
// - The dependency graph: one GraphNode per assignment, stored in the
//   instruction stream of the block that owns it
//
// Global and static variables get a slot in the global stack at load time;
// the executable only counts them, RuntimeMemory holds the values.
// ==============================================================================

#ifndef DSMIRROR_RUNTIME_EXECUTABLE_HPP
#define DSMIRROR_RUNTIME_EXECUTABLE_HPP

#include "class_table.hpp"
#include "expression.hpp"
#include "symbol_table.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dsm {

// ==============================================================================
// Code Blocks
// ==============================================================================

enum class CodeBlockKind {
    LANGUAGE,   // top-level program or a nested language block
    CONSTRUCT,  // if / while / for body
    FUNCTION    // function or method body, entered only through a call
};

const char* code_block_kind_to_string(CodeBlockKind kind);

/**
 * @brief One assignment and its dependency-graph bookkeeping
 *
 * Executing the node evaluates expression and stores the result in the
 * target symbol. reads lists the variables the expression depends on.
 */
struct GraphNode {
    int uid;
    int block_id;

    std::string target;
    int target_block;           // block whose runtime table owns the target
    int target_storage_index;   // target's slot in that table

    ExprPtr expression;
    std::vector<std::string> reads;

    bool is_dirty = true;

    LineNumber source_line = 0;
};

struct CodeBlock {
    int id;
    CodeBlockKind kind;
    CodeBlock* parent = nullptr;
    std::vector<CodeBlock*> children;

    // Instruction stream in program order
    std::vector<GraphNode> nodes;

    /**
     * @brief True if block_id is a strict ancestor of this block
     *
     * The walk starts at the parent, so a block is not its own ancestor.
     */
    bool is_my_ancestor_block(int block_id) const;
};

// ==============================================================================
// Procedures
// ==============================================================================

struct ProcedureNode {
    std::string name;
    int id = Constants::INVALID_INDEX;

    // Owning class, or INVALID_INDEX for a global function
    int class_scope = Constants::INVALID_INDEX;

    // Block holding the body's symbols
    int block_id = Constants::ROOT_BLOCK;

    // Arguments plus locals; each call reserves this many frame slots
    int local_count = 0;
};

// ==============================================================================
// Executable Class
// ==============================================================================

class Executable {
public:
    Executable();

    // =========================================================================
    // Code Blocks
    // =========================================================================

    /**
     * @brief Add a code block
     *
     * Block ids are dense: the new block must be id code_block_count().
     *
     * @param parent_id Parent block, or std::nullopt for a top-level block
     * @throws RuntimeError for a non-dense id or an unknown parent
     */
    CodeBlock& add_code_block(int id, std::optional<int> parent_id, CodeBlockKind kind);

    bool has_code_block(int id) const {
        return id >= 0 && id < static_cast<int>(code_blocks_.size());
    }

    /**
     * @throws InternalError for an unknown block id
     */
    const CodeBlock& code_block(int id) const;
    CodeBlock& code_block(int id);

    size_t code_block_count() const { return code_blocks_.size(); }

    /**
     * @brief Blocks without a parent, in id order
     */
    std::vector<CodeBlock*> top_level_blocks() const;

    /**
     * @brief Runtime symbol table of a block
     */
    const SymbolTable& runtime_symbols(int block_id) const;
    SymbolTable& runtime_symbols(int block_id);

    // =========================================================================
    // Classes and Procedures
    // =========================================================================

    const ClassTable& class_table() const { return class_table_; }
    ClassTable& class_table() { return class_table_; }

    int add_procedure(ProcedureNode procedure);

    /**
     * @return The procedure, or nullptr for an unknown id
     */
    const ProcedureNode* procedure(int id) const;
    ProcedureNode* procedure(int id);

    std::optional<int> find_procedure(const std::string& name, int class_scope) const;

    size_t procedure_count() const { return procedures_.size(); }

    // =========================================================================
    // Global Storage
    // =========================================================================

    /**
     * @brief Reserve one slot in the global stack
     */
    int allocate_global_slot() { return global_size_++; }

    int global_size() const { return global_size_; }

    // =========================================================================
    // Dependency Graph
    // =========================================================================

    /**
     * @brief Append an assignment to a block's instruction stream
     */
    GraphNode& add_graph_node(int block_id, const std::string& target,
                              int target_block, int target_storage_index,
                              ExprPtr expression, LineNumber source_line);

    /**
     * @brief First graph node (block order, then program order) assigning name
     *
     * @return The node, or nullptr if nothing assigns name
     */
    GraphNode* get_first_graph_node(const std::string& name);

    /**
     * @brief All graph nodes that transitively read the target of start
     *
     * start itself is not included. Each node appears once, in discovery
     * order.
     */
    std::vector<GraphNode*> update_dependency_graph(const GraphNode& start);

    size_t graph_node_count() const;

private:
    std::vector<std::unique_ptr<CodeBlock>> code_blocks_;
    std::vector<std::unique_ptr<SymbolTable>> runtime_symbols_;
    std::vector<ProcedureNode> procedures_;
    ClassTable class_table_;

    int global_size_ = 0;
    int next_graph_uid_ = 0;
};

}  // namespace dsm

#endif  // DSMIRROR_RUNTIME_EXECUTABLE_HPP
