// ==============================================================================
// Symbol Table
// ==============================================================================
// Name -> storage resolution for exactly one scope (a code block's globals, or
// one class's fields and method locals). Symbols are kept in declaration
// order and indexed by name for the disambiguated (name, class, function)
// lookup used by the loader and the mirror.
//
// Storage indices are stable: once a symbol is appended its index never
// changes. Interactive redefinition uses undefine_symbol(), which leaves an
// inert placeholder in the slot. remove() exists for compile-time pruning
// only; indices come from a monotonic counter, so even remove() never hands a
// surviving index to a new symbol.
// ==============================================================================

#ifndef DSMIRROR_SYMBOLS_SYMBOL_TABLE_HPP
#define DSMIRROR_SYMBOLS_SYMBOL_TABLE_HPP

#include "symbol_node.hpp"
#include <map>
#include <unordered_map>
#include <string>
#include <vector>
#include <optional>

namespace dsm {

class SymbolTable {
public:
    SymbolTable(const std::string& scope_name, int runtime_index);

    // =========================================================================
    // Mutation
    // =========================================================================

    /**
     * @brief Add a symbol to the table
     *
     * Assigns node.storage_index. Symbols outside any function contribute
     * their size to get_global_size().
     *
     * @return The new storage index, or std::nullopt if an equal symbol
     *         (same name, function, class and block) is already present
     */
    std::optional<int> append(SymbolNode node);

    /**
     * @brief Replace a symbol with a blank placeholder, keeping its slot
     *
     * Every other storage index stays valid.
     */
    void undefine_symbol(const SymbolNode& node);

    /**
     * @brief Erase a symbol outright (compile-time use only)
     *
     * Interactive sessions must use undefine_symbol() instead.
     *
     * @return true if the slot existed
     */
    bool remove(const SymbolNode& node);

    // =========================================================================
    // Lookup
    // =========================================================================

    /**
     * @brief First symbol with this name, in declaration order
     *
     * Ignores scope entirely and can pick the wrong shadowed symbol; prefer
     * the scoped overloads.
     */
    std::optional<int> index_of(const std::string& name) const;

    /**
     * @brief First symbol with this name in a class, any function
     */
    std::optional<int> index_of(const std::string& name, int class_scope) const;

    /**
     * @brief Symbol with this name, class and function
     */
    std::optional<int> index_of(const std::string& name, int class_scope,
                                int function_index) const;

    /**
     * @brief Class member lookup
     *
     * A same-named symbol declared outside any function (a field) matches
     * from every method. Only when no such field exists does the lookup fall
     * back to an exact class + function match.
     */
    std::optional<int> index_of_class(const std::string& name, int class_scope,
                                      int function_index) const;

    /**
     * @brief All live symbols with this name, in declaration order
     */
    std::vector<const SymbolNode*> nodes_for_name(const std::string& name) const;

    // =========================================================================
    // Access
    // =========================================================================

    /**
     * @brief Symbol at a storage index
     *
     * @throws InternalError if the index was never assigned or was removed
     */
    const SymbolNode& at(int storage_index) const;
    SymbolNode& at(int storage_index);

    bool contains(int storage_index) const { return symbols_.count(storage_index) > 0; }

    /**
     * @brief All slots in declaration order (placeholders included)
     */
    const std::map<int, SymbolNode>& symbols() const { return symbols_; }

    size_t size() const { return symbols_.size(); }

    /**
     * @brief Total size of the symbols declared outside any function
     */
    int get_global_size() const { return global_size_; }

    const std::string& scope_name() const { return scope_name_; }
    int runtime_index() const { return runtime_index_; }

private:
    std::string scope_name_;
    int runtime_index_;
    int global_size_ = 0;
    int next_index_ = 0;

    // storage index -> symbol, iterated in declaration order
    std::map<int, SymbolNode> symbols_;

    // name -> storage indices of live symbols with that name
    std::unordered_map<std::string, std::vector<int>> name_index_;

    std::optional<int> find_equal(const SymbolNode& node) const;
    void drop_from_name_index(const std::string& name, int storage_index);
};

}  // namespace dsm

#endif  // DSMIRROR_SYMBOLS_SYMBOL_TABLE_HPP
