// ==============================================================================
// Symbol Node
// ==============================================================================
// Descriptor of one named storage slot: a global, a class field (instance or
// static), a function local or argument, or a compiler temporary.
// ==============================================================================

#ifndef DSMIRROR_SYMBOLS_SYMBOL_NODE_HPP
#define DSMIRROR_SYMBOLS_SYMBOL_NODE_HPP

#include "types.hpp"
#include <string>
#include <vector>
#include <optional>

namespace dsm {

struct SymbolNode {
    std::string name;

    // Slot in the owning SymbolTable, assigned by SymbolTable::append
    int storage_index = Constants::INVALID_INDEX;

    // Where the value lives: global stack slot, frame-relative local slot,
    // or field slot inside an instance
    int memory_index = Constants::INVALID_INDEX;

    int class_scope = Constants::INVALID_INDEX;
    int function_index = Constants::GLOBAL_SCOPE;
    int absolute_class_scope = Constants::GLOBAL_SCOPE;
    int absolute_function_index = Constants::GLOBAL_SCOPE;
    int code_block_id = Constants::INVALID_INDEX;
    int runtime_table_index = Constants::INVALID_INDEX;

    Type datatype;
    Type static_type;

    bool is_argument = false;
    bool is_temp = false;
    bool is_static = false;

    int size = 1;
    int data_size = 1;

    AccessModifier access = AccessModifier::PUBLIC;
    MemoryRegion memory_region = MemoryRegion::INVALID;

    // Set only for fixed-size array declarations ("int grid[3][4]"), which
    // the mirror does not support
    std::optional<std::vector<int>> array_sizes;

    SymbolNode() = default;

    /**
     * @brief Build a declared symbol
     *
     * Names beginning with '%' are compiler temporaries.
     */
    SymbolNode(const std::string& name, const Type& datatype,
               int class_scope, int function_index, int code_block_id);

    /**
     * @brief True for the inert placeholder left behind by undefine_symbol
     */
    bool is_blank() const { return name.empty(); }

    /**
     * @brief True for symbols visible outside any function
     */
    bool is_global_scope() const { return function_index == Constants::GLOBAL_SCOPE; }

    /**
     * @brief Narrow the static type
     *
     * datatype follows the new type unless it is a plain scalar "var".
     */
    void set_static_type(const Type& new_type);

    // Identity is name + function + class + code block
    bool operator==(const SymbolNode& other) const;
    bool operator!=(const SymbolNode& other) const { return !(*this == other); }
};

}  // namespace dsm

#endif  // DSMIRROR_SYMBOLS_SYMBOL_NODE_HPP
