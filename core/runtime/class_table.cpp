// ==============================================================================
// Class Table Implementation
// ==============================================================================

#include "class_table.hpp"
#include "error.hpp"

namespace dsm {

std::vector<const SymbolNode*> ClassNode::fields() const {
    std::vector<const SymbolNode*> result;
    for (const auto& [index, symbol] : symbols.symbols()) {
        if (!symbol.is_blank() && symbol.function_index == Constants::GLOBAL_SCOPE) {
            result.push_back(&symbol);
        }
    }
    return result;
}

// ==============================================================================
// Class Registration
// ==============================================================================

ClassTable::ClassTable() {
    int count = static_cast<int>(PrimitiveType::MAX_PRIMITIVES);
    for (int id = 0; id < count; id++) {
        register_class(primitive_type_to_string(static_cast<PrimitiveType>(id)), false);
    }
}

int ClassTable::add_class(const std::string& name, bool is_imported) {
    if (ids_by_name_.count(name) > 0) {
        throw RuntimeError("Class '" + name + "' is already defined");
    }
    return register_class(name, is_imported);
}

int ClassTable::register_class(const std::string& name, bool is_imported) {
    int id = static_cast<int>(classes_.size());
    auto node = std::make_unique<ClassNode>(name, id);
    node->is_imported = is_imported;
    classes_.push_back(std::move(node));
    ids_by_name_[name] = id;
    return id;
}

const ClassNode& ClassTable::at(int class_id) const {
    if (!contains(class_id)) {
        throw InternalError(build_error_message("Unknown class id ", class_id));
    }
    return *classes_[class_id];
}

ClassNode& ClassTable::at(int class_id) {
    if (!contains(class_id)) {
        throw InternalError(build_error_message("Unknown class id ", class_id));
    }
    return *classes_[class_id];
}

std::optional<int> ClassTable::find(const std::string& name) const {
    auto it = ids_by_name_.find(name);
    if (it == ids_by_name_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ==============================================================================
// Type System
// ==============================================================================

int ClassTable::get_type(const std::string& name) const {
    auto id = find(name);
    return id ? *id : static_cast<int>(PrimitiveType::VAR);
}

std::string ClassTable::get_type_name(int type_id) const {
    if (!contains(type_id)) {
        return primitive_type_to_string(PrimitiveType::VAR);
    }
    return classes_[type_id]->name;
}

Type ClassTable::build_type(int type_id, int rank) const {
    Type type;
    type.uid = contains(type_id) ? type_id : static_cast<int>(PrimitiveType::VAR);
    type.name = get_type_name(type.uid);
    type.rank = rank;
    return type;
}

Type ClassTable::build_primitive_type(PrimitiveType primitive, int rank) {
    Type type;
    type.name = primitive_type_to_string(primitive);
    type.uid = static_cast<int>(primitive);
    type.rank = rank;
    return type;
}

}  // namespace dsm
