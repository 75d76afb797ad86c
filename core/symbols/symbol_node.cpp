// ==============================================================================
// Symbol Node - Implementation
// ==============================================================================

#include "symbol_node.hpp"

namespace dsm {

SymbolNode::SymbolNode(const std::string& name, const Type& datatype,
                       int class_scope, int function_index, int code_block_id)
    : name(name)
    , class_scope(class_scope)
    , function_index(function_index)
    , absolute_class_scope(class_scope)
    , absolute_function_index(function_index)
    , code_block_id(code_block_id)
    , datatype(datatype)
    , static_type(datatype)
    , is_temp(!name.empty() && name[0] == '%')
{}

void SymbolNode::set_static_type(const Type& new_type) {
    if (static_type == new_type) {
        return;
    }

    static_type = new_type;
    if (static_type.uid != static_cast<int>(PrimitiveType::VAR) || static_type.rank != 0) {
        datatype = static_type;
    }
}

bool SymbolNode::operator==(const SymbolNode& other) const {
    return name == other.name
        && function_index == other.function_index
        && class_scope == other.class_scope
        && code_block_id == other.code_block_id;
}

}  // namespace dsm
