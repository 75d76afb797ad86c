// ==============================================================================
// Symbol Table Tests
// ==============================================================================
// Tests for symbol nodes and per-scope symbol tables: appending, the lookup
// family, field precedence, and index stability across redefinition.
// ==============================================================================

#include "symbol_table.hpp"
#include "class_table.hpp"
#include "error.hpp"
#include <iostream>

using namespace dsm;

static int test_count = 0;
static int pass_count = 0;

static bool had_failure = false;

static void check(bool condition, const std::string& name) {
    test_count++;
    if (condition) {
        pass_count++;
        std::cout << "PASS: " << name << "\n";
    } else {
        std::cout << "FAIL: " << name << "\n";
        had_failure = true;
    }
}

static Type int_type() {
    return ClassTable::build_primitive_type(PrimitiveType::INT, 0);
}

static SymbolNode make_symbol(const std::string& name, int class_scope = Constants::INVALID_INDEX,
                              int function_index = Constants::GLOBAL_SCOPE, int block = 0) {
    return SymbolNode(name, int_type(), class_scope, function_index, block);
}

// ==============================================================================
// Symbol Node Tests
// ==============================================================================

static void test_symbol_node() {
    std::cout << "\n--- Symbol Node ---\n";

    SymbolNode a = make_symbol("a");
    check(a.is_global_scope(), "global symbol has GLOBAL function index");
    check(!a.is_temp, "plain name is not a temporary");
    check(!a.is_blank(), "named symbol is not blank");

    SymbolNode temp = make_symbol("%t1");
    check(temp.is_temp, "'%' prefix marks a temporary");

    SymbolNode blank;
    check(blank.is_blank(), "default symbol is blank");

    // Identity is name + function + class + block
    check(make_symbol("x", 11, 2, 0) == make_symbol("x", 11, 2, 0), "same identity compares equal");
    check(make_symbol("x", 11, 2, 0) != make_symbol("x", 11, 3, 0), "different function differs");
    check(make_symbol("x", 11, 2, 0) != make_symbol("x", 12, 2, 0), "different class differs");
    check(make_symbol("x", 11, 2, 0) != make_symbol("x", 11, 2, 1), "different block differs");

    // Narrowing a var keeps datatype unless the new type is informative
    SymbolNode var_symbol("v", ClassTable::build_primitive_type(PrimitiveType::VAR, 0),
                          Constants::INVALID_INDEX, Constants::GLOBAL_SCOPE, 0);
    var_symbol.set_static_type(ClassTable::build_primitive_type(PrimitiveType::DOUBLE, 0));
    check(var_symbol.datatype.uid == static_cast<int>(PrimitiveType::DOUBLE),
          "set_static_type narrows datatype");
}

// ==============================================================================
// Append and Lookup Tests
// ==============================================================================

static void test_append() {
    std::cout << "\n--- Append ---\n";

    SymbolTable table("block 0", 0);

    auto a = table.append(make_symbol("a"));
    auto b = table.append(make_symbol("b"));
    check(a.has_value() && *a == 0, "first symbol gets index 0");
    check(b.has_value() && *b == 1, "second symbol gets index 1");
    check(table.size() == 2, "table holds 2 symbols");
    check(table.at(1).storage_index == 1, "storage_index recorded on the node");

    auto duplicate = table.append(make_symbol("a"));
    check(!duplicate.has_value(), "duplicate identity rejected");
    check(table.size() == 2, "rejected duplicate not stored");

    // Same name in another function is a different symbol
    auto local = table.append(make_symbol("a", Constants::INVALID_INDEX, 4));
    check(local.has_value() && *local == 2, "same name, other function accepted");

    check(table.scope_name() == "block 0", "scope name kept");
    check(table.runtime_index() == 0, "runtime index kept");
}

static void test_global_size() {
    std::cout << "\n--- Global Size ---\n";

    SymbolTable table("block 0", 0);
    table.append(make_symbol("g1"));
    table.append(make_symbol("g2"));
    table.append(make_symbol("local", Constants::INVALID_INDEX, 3));

    SymbolNode wide = make_symbol("wide");
    wide.size = 4;
    table.append(wide);

    check(table.get_global_size() == 6, "only global-scope symbols count toward global size");
}

static void test_lookups() {
    std::cout << "\n--- Lookups ---\n";

    SymbolTable table("Point", 11);
    table.append(make_symbol("x", 11, Constants::GLOBAL_SCOPE));   // field
    table.append(make_symbol("x", 11, 2));                         // local of method 2
    table.append(make_symbol("y", 11, Constants::GLOBAL_SCOPE));   // field
    table.append(make_symbol("x", 12, Constants::GLOBAL_SCOPE));   // other class

    check(table.index_of("x") == 0, "index_of(name) returns the first match");
    check(!table.index_of("missing").has_value(), "index_of(name) misses without throwing");

    check(table.index_of("x", 12) == 3, "index_of(name, class) filters by class");
    check(!table.index_of("y", 12).has_value(), "index_of(name, class) misses other classes");

    check(table.index_of("x", 11, 2) == 1, "index_of(name, class, function) exact match");
    check(table.index_of("x", 11, Constants::GLOBAL_SCOPE) == 0, "exact match for field");
    check(!table.index_of("x", 11, 5).has_value(), "exact match misses other functions");

    check(table.nodes_for_name("x").size() == 3, "nodes_for_name lists all same-named symbols");
    check(table.nodes_for_name("nothing").empty(), "nodes_for_name empty for unknown name");

    bool caught = false;
    try {
        table.at(42);
    } catch (const InternalError&) {
        caught = true;
    }
    check(caught, "at() with unknown index throws InternalError");
    check(table.contains(2) && !table.contains(42), "contains() reports slots");
}

static void test_index_of_class() {
    std::cout << "\n--- Field Precedence ---\n";

    SymbolTable table("Point", 11);
    table.append(make_symbol("x", 11, 2));                         // local of method 2 first
    table.append(make_symbol("x", 11, Constants::GLOBAL_SCOPE));   // field
    table.append(make_symbol("d", 11, 3));                         // local of method 3

    // The field wins over an exact local match in index_of_class
    check(table.index_of_class("x", 11, 2) == 1, "field visible from any method wins");
    check(table.index_of_class("x", 11, 7) == 1, "field visible from unrelated method");

    // Without a same-named field, fall back to exact class + function
    check(table.index_of_class("d", 11, 3) == 2, "local found when no field shadows it");
    check(!table.index_of_class("d", 11, 4).has_value(), "local invisible from other method");
    check(!table.index_of_class("zzz", 11, 3).has_value(), "unknown name not found");
}

// ==============================================================================
// Redefinition Tests
// ==============================================================================

static void test_undefine_keeps_indices() {
    std::cout << "\n--- Undefine Keeps Indices ---\n";

    SymbolTable table("block 0", 0);
    const int count = 6;
    for (int i = 0; i < count; i++) {
        table.append(make_symbol("v" + std::to_string(i)));
    }

    SymbolNode victim = table.at(3);
    table.undefine_symbol(victim);

    bool stable = true;
    for (int i = 0; i < count; i++) {
        if (i == 3) {
            continue;
        }
        const SymbolNode& symbol = table.at(i);
        if (symbol.storage_index != i || symbol.name != "v" + std::to_string(i)) {
            stable = false;
        }
    }
    check(stable, "other symbols keep their storage index after undefine");

    check(table.size() == static_cast<size_t>(count), "undefine keeps the slot");
    check(table.at(3).is_blank(), "undefined slot holds a blank placeholder");
    check(table.at(3).storage_index == 3, "placeholder keeps its storage index");
    check(!table.index_of("v3").has_value(), "undefined name no longer found");
    check(!table.index_of("v3", Constants::INVALID_INDEX, Constants::GLOBAL_SCOPE).has_value(),
          "undefined name dropped from the name index");

    // Redefinition gets a fresh index, never the tombstoned one
    auto redefined = table.append(make_symbol("v3"));
    check(redefined.has_value() && *redefined == count, "redefinition appends a new slot");
    check(table.index_of("v3") == count, "redefined symbol found at its new slot");
}

static void test_remove_never_reuses_indices() {
    std::cout << "\n--- Remove ---\n";

    SymbolTable table("block 0", 0);
    table.append(make_symbol("a"));
    table.append(make_symbol("b"));
    table.append(make_symbol("c"));

    check(table.remove(table.at(1)), "remove erases an existing slot");
    check(!table.contains(1), "removed slot is gone");
    check(table.at(2).name == "c", "later symbol keeps its index");
    check(table.get_global_size() == 2, "remove gives back global size");

    auto d = table.append(make_symbol("d"));
    check(d.has_value() && *d == 3, "indices are never reused after remove");

    SymbolNode stranger = make_symbol("zzz");
    stranger.storage_index = 99;
    check(!table.remove(stranger), "remove of unknown slot returns false");
}

// ==============================================================================
// Main
// ==============================================================================

int main() {
    std::cout << "=== Symbol Table Tests ===\n";

    test_symbol_node();
    test_append();
    test_global_size();
    test_lookups();
    test_index_of_class();
    test_undefine_keeps_indices();
    test_remove_never_reuses_indices();

    std::cout << "\n=== " << pass_count << "/" << test_count
              << " tests passed! ===\n";
    if (had_failure) {
        std::cout << "SOME TESTS FAILED\n";
        return 1;
    }
    return 0;
}
