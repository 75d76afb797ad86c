// ==============================================================================
// Executable Implementation
// ==============================================================================

#include "executable.hpp"
#include "error.hpp"
#include <algorithm>
#include <deque>
#include <unordered_set>

namespace dsm {

const char* code_block_kind_to_string(CodeBlockKind kind) {
    switch (kind) {
        case CodeBlockKind::LANGUAGE:  return "language";
        case CodeBlockKind::CONSTRUCT: return "construct";
        case CodeBlockKind::FUNCTION:  return "function";
        default:                       return "unknown";
    }
}

bool CodeBlock::is_my_ancestor_block(int block_id) const {
    for (const CodeBlock* block = parent; block != nullptr; block = block->parent) {
        if (block->id == block_id) {
            return true;
        }
    }
    return false;
}

Executable::Executable() = default;

// ==============================================================================
// Code Blocks
// ==============================================================================

CodeBlock& Executable::add_code_block(int id, std::optional<int> parent_id,
                                      CodeBlockKind kind) {
    if (id != static_cast<int>(code_blocks_.size())) {
        throw RuntimeError(build_error_message(
            "Code block ids must be consecutive: expected ", code_blocks_.size(),
            ", got ", id));
    }

    CodeBlock* parent = nullptr;
    if (parent_id) {
        if (!has_code_block(*parent_id)) {
            throw RuntimeError(build_error_message(
                "Code block ", id, " has unknown parent ", *parent_id));
        }
        parent = code_blocks_[*parent_id].get();
    }

    auto block = std::make_unique<CodeBlock>();
    block->id = id;
    block->kind = kind;
    block->parent = parent;
    if (parent) {
        parent->children.push_back(block.get());
    }

    code_blocks_.push_back(std::move(block));
    runtime_symbols_.push_back(
        std::make_unique<SymbolTable>("block " + std::to_string(id), id));

    return *code_blocks_.back();
}

const CodeBlock& Executable::code_block(int id) const {
    if (!has_code_block(id)) {
        throw InternalError(build_error_message("Unknown code block ", id));
    }
    return *code_blocks_[id];
}

CodeBlock& Executable::code_block(int id) {
    if (!has_code_block(id)) {
        throw InternalError(build_error_message("Unknown code block ", id));
    }
    return *code_blocks_[id];
}

std::vector<CodeBlock*> Executable::top_level_blocks() const {
    std::vector<CodeBlock*> result;
    for (const auto& block : code_blocks_) {
        if (block->parent == nullptr) {
            result.push_back(block.get());
        }
    }
    return result;
}

const SymbolTable& Executable::runtime_symbols(int block_id) const {
    if (!has_code_block(block_id)) {
        throw InternalError(build_error_message("No symbol table for block ", block_id));
    }
    return *runtime_symbols_[block_id];
}

SymbolTable& Executable::runtime_symbols(int block_id) {
    if (!has_code_block(block_id)) {
        throw InternalError(build_error_message("No symbol table for block ", block_id));
    }
    return *runtime_symbols_[block_id];
}

// ==============================================================================
// Procedures
// ==============================================================================

int Executable::add_procedure(ProcedureNode procedure) {
    procedure.id = static_cast<int>(procedures_.size());
    procedures_.push_back(std::move(procedure));
    return procedures_.back().id;
}

const ProcedureNode* Executable::procedure(int id) const {
    if (id < 0 || id >= static_cast<int>(procedures_.size())) {
        return nullptr;
    }
    return &procedures_[id];
}

ProcedureNode* Executable::procedure(int id) {
    if (id < 0 || id >= static_cast<int>(procedures_.size())) {
        return nullptr;
    }
    return &procedures_[id];
}

std::optional<int> Executable::find_procedure(const std::string& name, int class_scope) const {
    for (const auto& procedure : procedures_) {
        if (procedure.name == name && procedure.class_scope == class_scope) {
            return procedure.id;
        }
    }
    return std::nullopt;
}

// ==============================================================================
// Dependency Graph
// ==============================================================================

GraphNode& Executable::add_graph_node(int block_id, const std::string& target,
                                      int target_block, int target_storage_index,
                                      ExprPtr expression, LineNumber source_line) {
    GraphNode node;
    node.uid = next_graph_uid_++;
    node.block_id = block_id;
    node.target = target;
    node.target_block = target_block;
    node.target_storage_index = target_storage_index;
    node.reads = collect_symbol_reads(*expression);
    node.expression = std::move(expression);
    node.source_line = source_line;

    CodeBlock& block = code_block(block_id);
    block.nodes.push_back(std::move(node));
    return block.nodes.back();
}

GraphNode* Executable::get_first_graph_node(const std::string& name) {
    for (auto& block : code_blocks_) {
        for (auto& node : block->nodes) {
            if (node.target == name) {
                return &node;
            }
        }
    }
    return nullptr;
}

std::vector<GraphNode*> Executable::update_dependency_graph(const GraphNode& start) {
    std::vector<GraphNode*> reachable;
    std::unordered_set<int> seen{start.uid};
    std::deque<const GraphNode*> pending{&start};

    while (!pending.empty()) {
        const GraphNode* current = pending.front();
        pending.pop_front();

        for (auto& block : code_blocks_) {
            for (auto& node : block->nodes) {
                if (seen.count(node.uid) > 0) {
                    continue;
                }
                bool depends = std::find(node.reads.begin(), node.reads.end(),
                                         current->target) != node.reads.end();
                if (depends) {
                    seen.insert(node.uid);
                    reachable.push_back(&node);
                    pending.push_back(&node);
                }
            }
        }
    }

    return reachable;
}

size_t Executable::graph_node_count() const {
    size_t count = 0;
    for (const auto& block : code_blocks_) {
        count += block->nodes.size();
    }
    return count;
}

}  // namespace dsm
