// ==============================================================================
// Class Table and Type System
// ==============================================================================
// Every class known to the runtime, addressed by class id. The built-in types
// (int, double, string, ...) are registered first as ids 0..MAX_PRIMITIVES-1
// so that a value's class id doubles as its type id. User classes follow.
//
// Each class owns one SymbolTable holding its fields (function index GLOBAL),
// its static fields, and the locals and arguments of its methods (function
// index = the method's procedure id).
// ==============================================================================

#ifndef DSMIRROR_RUNTIME_CLASS_TABLE_HPP
#define DSMIRROR_RUNTIME_CLASS_TABLE_HPP

#include "types.hpp"
#include "symbol_table.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dsm {

struct ClassNode {
    std::string name;
    int id;
    SymbolTable symbols;

    // Instances are owned by a foreign runtime and rendered by the
    // ForeignMarshaller
    bool is_imported = false;

    // Number of per-instance field slots (static fields excluded)
    int instance_size = 0;

    ClassNode(const std::string& name, int id)
        : name(name)
        , id(id)
        , symbols(name, id)
    {}

    /**
     * @brief Fields and static fields in declared order
     */
    std::vector<const SymbolNode*> fields() const;
};

class ClassTable {
public:
    /**
     * @brief Create a table holding only the built-in types
     */
    ClassTable();

    /**
     * @brief Register a user class
     *
     * @return The new class id (always >= MAX_PRIMITIVES)
     * @throws RuntimeError if a class with this name already exists
     */
    int add_class(const std::string& name, bool is_imported = false);

    /**
     * @brief Look up a class by id
     *
     * @throws InternalError for an unknown id
     */
    const ClassNode& at(int class_id) const;
    ClassNode& at(int class_id);

    bool contains(int class_id) const {
        return class_id >= 0 && class_id < static_cast<int>(classes_.size());
    }

    std::optional<int> find(const std::string& name) const;

    size_t size() const { return classes_.size(); }

    // =========================================================================
    // Type System
    // =========================================================================

    /**
     * @brief Type id for a type name
     *
     * @return The class id, or VAR for an unknown name
     */
    int get_type(const std::string& name) const;

    /**
     * @brief Name of a type id ("int", "Point", ...)
     */
    std::string get_type_name(int type_id) const;

    /**
     * @brief Build a type for any class id
     */
    Type build_type(int type_id, int rank) const;

    static Type build_primitive_type(PrimitiveType type, int rank);

private:
    std::vector<std::unique_ptr<ClassNode>> classes_;
    std::unordered_map<std::string, int> ids_by_name_;

    int register_class(const std::string& name, bool is_imported);
};

}  // namespace dsm

#endif  // DSMIRROR_RUNTIME_CLASS_TABLE_HPP
