// ==============================================================================
// Symbol Table - Implementation
// ==============================================================================

#include "symbol_table.hpp"
#include "error.hpp"
#include <algorithm>

namespace dsm {

SymbolTable::SymbolTable(const std::string& scope_name, int runtime_index)
    : scope_name_(scope_name)
    , runtime_index_(runtime_index)
{}

// ==============================================================================
// Mutation
// ==============================================================================

std::optional<int> SymbolTable::append(SymbolNode node) {
    if (find_equal(node)) {
        return std::nullopt;
    }

    int storage_index = next_index_++;
    node.storage_index = storage_index;

    if (node.function_index == Constants::GLOBAL_SCOPE) {
        global_size_ += node.size;
    }

    name_index_[node.name].push_back(storage_index);
    symbols_.emplace(storage_index, std::move(node));

    return storage_index;
}

void SymbolTable::undefine_symbol(const SymbolNode& node) {
    auto it = symbols_.find(node.storage_index);
    if (it == symbols_.end() || it->second != node) {
        return;
    }

    drop_from_name_index(node.name, node.storage_index);

    // Keep the slot, blank the contents
    SymbolNode placeholder;
    placeholder.storage_index = node.storage_index;
    it->second = placeholder;
}

bool SymbolTable::remove(const SymbolNode& node) {
    auto it = symbols_.find(node.storage_index);
    if (it == symbols_.end()) {
        return false;
    }

    drop_from_name_index(it->second.name, node.storage_index);
    if (it->second.function_index == Constants::GLOBAL_SCOPE && !it->second.is_blank()) {
        global_size_ -= it->second.size;
    }
    symbols_.erase(it);
    return true;
}

// ==============================================================================
// Lookup
// ==============================================================================

std::optional<int> SymbolTable::index_of(const std::string& name) const {
    for (const auto& [index, symbol] : symbols_) {
        if (!symbol.is_blank() && symbol.name == name) {
            return index;
        }
    }
    return std::nullopt;
}

std::optional<int> SymbolTable::index_of(const std::string& name, int class_scope) const {
    for (const auto& [index, symbol] : symbols_) {
        if (!symbol.is_blank() && symbol.name == name && symbol.class_scope == class_scope) {
            return index;
        }
    }
    return std::nullopt;
}

std::optional<int> SymbolTable::index_of(const std::string& name, int class_scope,
                                         int function_index) const {
    auto it = name_index_.find(name);
    if (it == name_index_.end()) {
        return std::nullopt;
    }

    for (int index : it->second) {
        const SymbolNode& symbol = symbols_.at(index);
        if (symbol.class_scope == class_scope && symbol.function_index == function_index) {
            return index;
        }
    }
    return std::nullopt;
}

std::optional<int> SymbolTable::index_of_class(const std::string& name, int class_scope,
                                               int function_index) const {
    auto it = name_index_.find(name);
    if (it == name_index_.end()) {
        return std::nullopt;
    }

    // Fields first: visible from any method
    for (int index : it->second) {
        if (symbols_.at(index).function_index == Constants::GLOBAL_SCOPE) {
            return index;
        }
    }

    for (int index : it->second) {
        const SymbolNode& symbol = symbols_.at(index);
        if (symbol.class_scope == class_scope && symbol.function_index == function_index) {
            return index;
        }
    }
    return std::nullopt;
}

std::vector<const SymbolNode*> SymbolTable::nodes_for_name(const std::string& name) const {
    std::vector<const SymbolNode*> result;
    auto it = name_index_.find(name);
    if (it == name_index_.end()) {
        return result;
    }

    result.reserve(it->second.size());
    for (int index : it->second) {
        result.push_back(&symbols_.at(index));
    }
    return result;
}

// ==============================================================================
// Access
// ==============================================================================

const SymbolNode& SymbolTable::at(int storage_index) const {
    auto it = symbols_.find(storage_index);
    if (it == symbols_.end()) {
        throw InternalError(build_error_message(
            "Symbol table '", scope_name_, "' has no slot ", storage_index));
    }
    return it->second;
}

SymbolNode& SymbolTable::at(int storage_index) {
    auto it = symbols_.find(storage_index);
    if (it == symbols_.end()) {
        throw InternalError(build_error_message(
            "Symbol table '", scope_name_, "' has no slot ", storage_index));
    }
    return it->second;
}

// ==============================================================================
// Internal Helpers
// ==============================================================================

std::optional<int> SymbolTable::find_equal(const SymbolNode& node) const {
    auto it = name_index_.find(node.name);
    if (it == name_index_.end()) {
        return std::nullopt;
    }

    for (int index : it->second) {
        if (symbols_.at(index) == node) {
            return index;
        }
    }
    return std::nullopt;
}

void SymbolTable::drop_from_name_index(const std::string& name, int storage_index) {
    auto it = name_index_.find(name);
    if (it == name_index_.end()) {
        return;
    }

    auto& indices = it->second;
    indices.erase(std::remove(indices.begin(), indices.end(), storage_index), indices.end());
    if (indices.empty()) {
        name_index_.erase(it);
    }
}

}  // namespace dsm
