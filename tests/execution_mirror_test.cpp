// ==============================================================================
// Execution Mirror Tests
// ==============================================================================
// Tests for the debugger-facing mirror: name resolution across blocks and
// frames, unpacking, bounded text rendering, core dumps, property filtering,
// watch sessions, and value mutation with replay.
//
// Uses assertions rather than a test framework for consistency.
// ==============================================================================

#include "execution_mirror.hpp"
#include "error.hpp"
#include <iostream>
#include <cmath>

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

// ==============================================================================
// Helpers
// ==============================================================================

static void run(Executive& executive, const std::string& source) {
    executive.load_string(source, "mirror_test.ds");
    executive.execute();
}

static bool obj_int(const Obj& obj, int64_t expected) {
    auto* payload = std::get_if<int64_t>(&obj.payload);
    return std::holds_alternative<IntValue>(obj.value) && payload && *payload == expected;
}

static bool obj_is_null(const Obj& obj) {
    return obj.type.uid == static_cast<int>(PrimitiveType::NULL_TYPE) && !obj.has_payload();
}

static const char* const POINT_CLASS =
    "CLASS Point\n"
    "  FIELD int x\n"
    "  FIELD int y\n"
    "  METHOD scaled\n"
    "    LOCAL int x\n"
    "  END\n"
    "  METHOD norm\n"
    "  END\n"
    "END\n";

/**
 * @brief Renders every imported instance the same way
 */
class FakeMarshaller : public ForeignMarshaller {
public:
    std::string get_string_value(const StackValue& value) const override {
        return "<foreign " + std::to_string(std::get<PointerValue>(value).handle) + ">";
    }
};

// ==============================================================================
// Value Access Tests
// ==============================================================================

static void test_get_value() {
    std::cout << "\n--- Value Access ---\n";

    Executive executive;
    run(executive,
        "a = 5\n"
        "b = a + 1\n"
        "name = \"dsm\"\n"
        "pi = 3.25\n"
        "VAR int later\n"
        "BLOCK 1 PARENT 0\n"
        "inner = 7\n");
    ExecutionMirror mirror(executive);

    check(obj_int(mirror.get_value("b"), 6), "get_value reads a global");
    check(obj_int(mirror.get_value("inner"), 7), "block 0 searches every block's table");
    check(obj_int(mirror.get_value("inner", 1), 7), "explicit block searched");
    check(obj_is_null(mirror.get_value("later")), "unassigned global unpacks as null");

    Obj name = mirror.get_value("name");
    auto* text = std::get_if<std::string>(&name.payload);
    check(text && *text == "dsm", "string payload copied out of the heap");

    bool caught = false;
    try {
        mirror.get_value("a", 1);
    } catch (const SymbolNotFoundError& e) {
        caught = e.name() == "a";
    }
    check(caught, "explicit block does not search its parents");

    caught = false;
    try {
        mirror.get_value("zzz");
    } catch (const SymbolNotFoundError& e) {
        caught = e.name() == "zzz";
    }
    check(caught, "unknown global throws SymbolNotFoundError");

    check(mirror.get_type("a") == "int", "type of int");
    check(mirror.get_type("pi") == "double", "type of double");
    check(mirror.get_type("name") == "string", "type of string");
    check(mirror.get_type("later") == "null", "type of unassigned variable");

    check(std::holds_alternative<IntValue>(mirror.get_global_value("inner")),
          "get_global_value finds nested global");
}

static void test_global_lookups() {
    std::cout << "\n--- Global Lookups ---\n";

    Executive executive;
    run(executive,
        "a = 1\n"
        "BLOCK 1 PARENT 0\n"
        "b = 2\n");
    ExecutionMirror mirror(executive);

    StackValue b = mirror.get_global_value("b");
    check(std::holds_alternative<IntValue>(b) && std::get<IntValue>(b).value == 2,
          "get_global_value reads the first declaring block");
    check(is_null(mirror.get_global_value("zz")), "missing global reads as null");
    check(is_null(mirror.get_global_value("a", 1)), "search starts at start_block");

    check(obj_int(mirror.get_first_value("b"), 2), "get_first_value unpacks");

    bool caught = false;
    try {
        mirror.get_raw_first_value("zz");
    } catch (const NameNotFoundError& e) {
        caught = e.name() == "zz";
    }
    check(caught, "get_raw_first_value throws for a missing name");
}

// ==============================================================================
// Name Resolution Tests
// ==============================================================================

static void test_nested_block_resolution() {
    std::cout << "\n--- Nested Block Resolution ---\n";

    Executive executive;
    run(executive,
        "VAR int x\n"
        "x = 0\n"
        "BLOCK 1 PARENT 0\n"
        "d1 = 1\n"
        "BLOCK 2 PARENT 1\n"
        "VAR int x\n"
        "x = 2\n"
        "d2 = 2\n"
        "BLOCK 3 PARENT 2\n"
        "d3 = 3\n");
    ExecutionMirror mirror(executive);

    executive.set_running_block(3);
    check(obj_int(mirror.get_debug_value("d3"), 3), "own block");
    check(obj_int(mirror.get_debug_value("d2"), 2), "one block up");
    check(obj_int(mirror.get_debug_value("d1"), 1), "two blocks up");
    check(obj_int(mirror.get_debug_value("x"), 2), "nearest declaration shadows outer one");
    check(mirror.get_symbol_index("x", 3).block_id == 2, "shadowing declaration found in block 2");

    executive.set_running_block(1);
    check(obj_int(mirror.get_debug_value("x"), 0), "outer declaration seen from block 1");

    bool caught = false;
    try {
        mirror.get_debug_value("d3");
    } catch (const NameNotFoundError&) {
        caught = true;
    }
    check(caught, "inner block names invisible from outer blocks");
}

static void test_name_errors() {
    std::cout << "\n--- Name Errors ---\n";

    Executive executive;
    run(executive,
        "a = 1\n"
        "VAR int later\n"
        "VAR int grid[3][4]\n");
    ExecutionMirror mirror(executive);

    bool caught = false;
    try {
        mirror.get_debug_value("doesNotExist");
    } catch (const NameNotFoundError& e) {
        caught = e.name() == "doesNotExist";
    }
    check(caught, "unknown name reports the exact name");

    caught = false;
    try {
        mirror.get_debug_value("later");
    } catch (const UninitializedVariableError& e) {
        caught = e.name() == "later";
    }
    check(caught, "unassigned variable throws UninitializedVariableError");

    caught = false;
    try {
        mirror.get_debug_value("grid");
    } catch (const UnsupportedFeatureError&) {
        caught = true;
    }
    check(caught, "fixed-size array declaration unsupported in debug lookup");

    caught = false;
    try {
        mirror.get_value("grid");
    } catch (const UnsupportedFeatureError&) {
        caught = true;
    }
    check(caught, "fixed-size array declaration unsupported in get_value");
}

static void test_method_resolution() {
    std::cout << "\n--- Method Scope Resolution ---\n";

    Executive executive;
    run(executive, std::string(POINT_CLASS) + "p = new Point(3, 4)\n");
    ExecutionMirror mirror(executive);

    const Executable& exe = executive.executable();
    int point = *exe.class_table().find("Point");
    int scaled = *exe.find_procedure("scaled", point);
    int norm = *exe.find_procedure("norm", point);
    StackValue receiver = mirror.get_raw_first_value("p");

    // Method without a same-named local: the field
    executive.enter_function_frame(norm, receiver);
    ResolvedSymbol field = mirror.get_symbol_index("x", executive.running_block());
    check(field.is_member_field, "x in norm resolves to the field");
    check(field.symbol->function_index == Constants::GLOBAL_SCOPE, "field has GLOBAL function");
    check(obj_int(mirror.get_debug_value("x"), 3), "field read through the receiver");
    check(obj_int(mirror.get_debug_value("y"), 4), "second field read through the receiver");
    check(mirror.get_type("x") == "int", "type of a field");
    executive.leave_function_frame();

    // Method with a local x: the local shadows the field
    executive.enter_function_frame(scaled, receiver);
    ResolvedSymbol local = mirror.get_symbol_index("x", executive.running_block());
    check(!local.is_member_field, "x in scaled resolves to the local");
    check(local.symbol->function_index == scaled, "local belongs to scaled");

    bool caught = false;
    try {
        mirror.get_debug_value("x");
    } catch (const UninitializedVariableError&) {
        caught = true;
    }
    check(caught, "unassigned local reported as uninitialized");

    executive.memory().set_symbol_value(*local.symbol, IntValue{30});
    check(obj_int(mirror.get_debug_value("x"), 30), "local value read from the frame");
    check(obj_int(mirror.get_debug_value("y"), 4), "fields still visible next to locals");

    caught = false;
    try {
        mirror.get_debug_value("p");
    } catch (const NameNotFoundError&) {
        caught = true;
    }
    check(caught, "globals not searched from a method scope");
    executive.leave_function_frame();

    // Back outside any frame the global resolves again
    check(mirror.get_type("p") == "Point", "type of an instance is its class name");
}

static void test_function_resolution() {
    std::cout << "\n--- Function Scope Resolution ---\n";

    Executive executive;
    run(executive,
        "g = 1\n"
        "BLOCK 1 PARENT 0 KIND function\n"
        "FUNC twice BLOCK 1\n"
        "  ARG int n\n"
        "END\n"
        "BLOCK 2 PARENT 1\n"
        "VAR int inner\n");
    ExecutionMirror mirror(executive);

    int twice = *executive.executable().find_procedure("twice", Constants::INVALID_INDEX);
    executive.enter_function_frame(twice);

    ResolvedSymbol n = mirror.get_symbol_index("n", executive.running_block());
    check(n.symbol->is_argument && n.block_id == 1, "argument found in the body block");
    executive.memory().set_symbol_value(*n.symbol, IntValue{21});
    check(obj_int(mirror.get_debug_value("n"), 21), "argument read from the frame");
    check(obj_int(mirror.get_debug_value("g"), 1), "globals visible from a function");

    // Language block nested in the function body
    executive.set_running_block(2);
    ResolvedSymbol inner = mirror.get_symbol_index("inner", 2);
    check(inner.block_id == 2, "nested block's own symbol found first");
    check(mirror.get_symbol_index("n", 2).block_id == 1, "function locals visible from nested block");
    check(mirror.get_symbol_index("g", 2).block_id == 0, "globals visible from nested block");

    executive.leave_function_frame();
}

// ==============================================================================
// Unpack and Repack Tests
// ==============================================================================

static void test_unpack() {
    std::cout << "\n--- Unpack ---\n";

    Executive executive;
    run(executive,
        "arr = {1, 2, 3}\n"
        "empty = {}\n"
        "nested = {{1}, {2}}\n"
        "ch = 'c'\n"
        "flag = true\n"
        "BLOCK 1 PARENT 0 KIND function\n"
        "FUNC twice BLOCK 1\n"
        "END\n"
        "BLOCK 0\n"
        "fp = function twice\n");
    ExecutionMirror mirror(executive);

    Obj arr = mirror.get_value("arr");
    check(arr.array() != nullptr && arr.array()->members.size() == 3, "array members copied");
    check(arr.type.uid == static_cast<int>(PrimitiveType::INT), "array type from first member");
    check(arr.type.rank == Constants::ARBITRARY_RANK, "array rank arbitrary");
    check(arr.array() && obj_int(arr.array()->members[2], 3), "member values unpacked");
    check(mirror.get_type(arr) == "array", "type name of an array");

    Obj empty = mirror.get_value("empty");
    check(empty.array() && empty.array()->members.empty(), "empty array unpacked");
    check(empty.type.uid == static_cast<int>(PrimitiveType::VAR), "empty array has type var");

    Obj nested = mirror.get_value("nested");
    check(nested.array() && nested.array()->members[1].array() &&
          obj_int(nested.array()->members[1].array()->members[0], 2),
          "nested arrays unpacked recursively");

    Obj ch = mirror.get_value("ch");
    auto* code = std::get_if<int64_t>(&ch.payload);
    check(code && *code == 'c', "char payload is the character code");
    check(mirror.get_type(ch) == "char", "type name of a char");
    check(mirror.get_type(mirror.get_value("flag")) == "bool", "type name of a bool");
    check(mirror.get_type(mirror.get_value("fp")) == "function pointer",
          "type name of a function pointer");

    Heap scratch;
    ArrayPointerValue own = scratch.allocate_array({DoubleValue{1.5}});
    Obj from_scratch = mirror.unpack(own, scratch);
    check(from_scratch.array() && from_scratch.array()->members.size() == 1,
          "unpack against an explicit heap");

    const StackValue register_kinds[] = {
        DefaultArgValue{}, BlockIndexValue{2}, CallingConventionValue{BounceType::IMPLICIT}
    };
    int rejected = 0;
    for (const StackValue& value : register_kinds) {
        try {
            mirror.unpack(value);
        } catch (const UnsupportedFeatureError&) {
            rejected++;
        }
    }
    check(rejected == 3, "VM register kinds cannot be unpacked");

    Obj null_value = mirror.unpack(NullValue{});
    check(obj_is_null(null_value) && !null_value.has_payload(), "null has no payload");
    check(mirror.get_type(null_value) == "null", "type name of null");
}

static void test_repack() {
    std::cout << "\n--- Repack ---\n";

    Executive executive;
    run(executive, "arr = {1, {2, 3}}\nn = 4\n");
    ExecutionMirror mirror(executive);
    Heap& heap = executive.memory().heap();

    StackValue original = mirror.get_raw_first_value("arr");
    Obj arr = mirror.unpack(original);
    StackValue rebuilt = ExecutionMirror::repack(arr, heap);

    check(is_array(rebuilt) && !(rebuilt == original), "repack allocates a new array");
    const HeapArray& rebuilt_array = heap.to_array(rebuilt);
    check(rebuilt_array.count() == 2 && is_array(rebuilt_array.values[1]),
          "nested arrays rebuilt");
    check(mirror.get_string_value(rebuilt, heap, 0) == "{ 1, { 2, 3 } }",
          "rebuilt array renders like the original");

    Obj n = mirror.get_value("n");
    StackValue scalar = ExecutionMirror::repack(n, heap);
    check(std::holds_alternative<IntValue>(scalar) && std::get<IntValue>(scalar).value == 4,
          "scalars repack to their value");
}

// ==============================================================================
// Cycle Tests
// ==============================================================================

static void test_cycles() {
    std::cout << "\n--- Cycles ---\n";

    Executive executive;
    run(executive,
        "arr = {1, 2}\n"
        "CLASS Node\n"
        "  FIELD var next\n"
        "END\n"
        "n = new Node(null)\n");
    ExecutionMirror mirror(executive);
    Heap& heap = executive.memory().heap();

    StackValue arr = mirror.get_raw_first_value("arr");
    heap.set_array_element(std::get<ArrayPointerValue>(arr), 2, arr);

    check(mirror.get_string_value(arr, heap, 0, -1, -1) == "{ 1, 2, { ... } }",
          "self-referencing array terminates");

    Obj unpacked = mirror.unpack(arr);
    const DsasmArray* members = unpacked.array();
    check(members && members->members.size() == 3, "cyclic array unpacks its members");
    if (members && members->members.size() == 3) {
        const Obj& self = members->members[2];
        auto* handle = std::get_if<int64_t>(&self.payload);
        check(self.array() == nullptr && handle &&
              *handle == std::get<ArrayPointerValue>(arr).handle,
              "cyclic member carries the handle");
        check(self.type.uid == static_cast<int>(PrimitiveType::ARRAY) &&
              self.type.rank == Constants::ARBITRARY_RANK,
              "cyclic member typed as an array");
    }

    StackValue node = mirror.get_raw_first_value("n");
    heap.to_object(node).values[0] = node;
    check(mirror.get_string_value(node, heap, 0) == "Node(next = ...)",
          "self-referencing object terminates");

    // Siblings sharing one array are not cycles
    ArrayPointerValue shared = heap.allocate_array({IntValue{7}});
    ArrayPointerValue pair = heap.allocate_array({shared, shared});
    check(mirror.get_string_value(pair, heap, 0) == "{ { 7 }, { 7 } }",
          "shared array rendered at every position");

    // Two arrays holding each other
    ArrayPointerValue first = heap.allocate_array({IntValue{1}});
    ArrayPointerValue second = heap.allocate_array({IntValue{2}});
    heap.set_array_element(first, 1, second);
    heap.set_array_element(second, 1, first);
    check(mirror.get_string_value(first, heap, 0, -1, -1) == "{ 1, { 2, { ... } } }",
          "mutually referencing arrays terminate");

    Obj outer = mirror.unpack(first);
    const DsasmArray* outer_members = outer.array();
    check(outer_members && outer_members->members.size() == 2,
          "mutual cycle unpacks the outer array");
    if (outer_members && outer_members->members.size() == 2) {
        const DsasmArray* inner_members = outer_members->members[1].array();
        check(inner_members && inner_members->members.size() == 2,
              "mutual cycle unpacks the inner array");
        if (inner_members && inner_members->members.size() == 2) {
            const Obj& back = inner_members->members[1];
            auto* handle = std::get_if<int64_t>(&back.payload);
            check(back.array() == nullptr && handle && *handle == first.handle,
                  "back reference carries the outer handle");
        }
    }
}

// ==============================================================================
// Rendering Tests
// ==============================================================================

static void test_output_format_parameters() {
    std::cout << "\n--- Output Format Parameters ---\n";

    OutputFormatParameters params(4, 2);
    check(params.continue_output_trace(), "first level allowed");
    check(params.continue_output_trace(), "second level allowed");
    check(!params.continue_output_trace(), "third level refused");
    check(params.current_output_depth() == 0, "refusal consumes nothing");
    params.restore_output_trace_depth();
    params.restore_output_trace_depth();
    params.restore_output_trace_depth();
    check(params.current_output_depth() == 2, "restore capped at the maximum");

    params.continue_output_trace();
    params.reset_output_depth();
    check(params.current_output_depth() == 2, "reset restores the full budget");

    OutputFormatParameters unbounded(-1, -1);
    bool always = true;
    for (int i = 0; i < 100; i++) {
        always = always && unbounded.continue_output_trace();
    }
    check(always, "unbounded depth never refuses");
}

static void test_scalar_rendering() {
    std::cout << "\n--- Scalar Rendering ---\n";

    Executive executive;
    run(executive,
        "i = 42\n"
        "d = 3.25\n"
        "s = \"hi\"\n"
        "ch = 'c'\n"
        "flag = false\n"
        "nothing = null\n"
        "BLOCK 1 PARENT 0 KIND function\n"
        "FUNC twice BLOCK 1\n"
        "END\n"
        "BLOCK 0\n"
        "fp = function twice\n");
    ExecutionMirror mirror(executive);
    const Heap& heap = executive.memory().heap();

    auto render = [&](const std::string& name, bool for_print) {
        return mirror.get_string_value(mirror.get_raw_first_value(name), heap, 0, for_print);
    };

    check(render("i", false) == "42", "int");
    check(render("d", false) == "3.250000", "double with six decimals");
    check(render("s", false) == "\"hi\"", "string quoted");
    check(render("s", true) == "hi", "string unquoted for print");
    check(render("ch", false) == "'c'", "char quoted");
    check(render("ch", true) == "c", "char unquoted for print");
    check(render("flag", false) == "false", "bool");
    check(render("nothing", false) == "null", "null");
    check(render("fp", false) == "function: twice", "function pointer");
    check(mirror.get_string_value(InvalidValue{}, heap, 0) == "null", "invalid renders as null");
}

static void test_array_rendering() {
    std::cout << "\n--- Array Rendering ---\n";

    Executive executive;
    run(executive,
        "small = {1, 2, 3}\n"
        "big = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9}\n"
        "nested = {{{{{1}}}}}\n"
        "keyed = {1, \"k\" : 2}\n");
    ExecutionMirror mirror(executive);
    const Heap& heap = executive.memory().heap();

    StackValue small = mirror.get_raw_first_value("small");
    StackValue big = mirror.get_raw_first_value("big");
    StackValue nested = mirror.get_raw_first_value("nested");

    check(mirror.format_parameters().max_array_size() == 4, "limits start from the options");
    check(mirror.get_string_value(small, heap, 0) == "{ 1, 2, 3 }", "short array in full");
    check(mirror.get_string_value(small, heap, 0, true) == "{1,2,3}", "print form is compact");
    check(mirror.get_string_value(big, heap, 0, 4, -1) == "{ 0, 1, ..., 8, 9 }",
          "long array keeps both ends");
    check(mirror.get_string_value(big, heap, 0, -1, -1) ==
          "{ 0, 1, 2, 3, 4, 5, 6, 7, 8, 9 }", "unbounded array in full");

    check(mirror.get_string_value(nested, heap, 0, -1, 2) == "{ { { ... } } }",
          "nesting cut at the depth limit");
    check(mirror.format_parameters().current_output_depth() == 2,
          "depth budget restored after rendering");
    check(mirror.get_string_value(nested, heap, 0) == "{ { { ... } } }",
          "limits persist for later calls");
    check(mirror.get_string_value(nested, heap, 0, -1, -1) == "{ { { { { 1 } } } } }",
          "unbounded depth renders everything");

    check(mirror.get_string_value(mirror.get_raw_first_value("keyed"), heap, 0) ==
          "{ 1, \"k\"=2 }", "keyed entries follow positional ones");

    check(mirror.get_array_trace(small, heap, 0, false) == "1, 2, 3", "array trace has no braces");
    check(mirror.get_array_trace(small, heap, 0, true) == "1,2,3", "array trace print form");

    bool caught = false;
    try {
        mirror.get_array_trace(IntValue{1}, heap, 0, false);
    } catch (const RuntimeError&) {
        caught = true;
    }
    check(caught, "array trace of a scalar throws");
}

static void test_class_rendering() {
    std::cout << "\n--- Class Rendering ---\n";

    Executive executive;
    run(executive,
        std::string(POINT_CLASS) +
        "CLASS Chain\n"
        "  FIELD var next\n"
        "END\n"
        "CLASS Handle IMPORTED\n"
        "END\n"
        "p = new Point(1, 2)\n"
        "c = new Chain(new Chain(new Chain(null)))\n"
        "h = new Handle(7)\n"
        "fp = function Point.norm\n");
    const Heap& heap = executive.memory().heap();

    ExecutionMirror mirror(executive);
    StackValue p = mirror.get_raw_first_value("p");
    StackValue c = mirror.get_raw_first_value("c");
    StackValue h = mirror.get_raw_first_value("h");

    check(mirror.get_string_value(p, heap, 0) == "Point(x = 1, y = 2)", "instance fields");
    check(mirror.get_class_trace(p, heap, 0, true) == "Point{x = 1, y = 2}",
          "print form uses braces");
    check(mirror.print_class(p, heap, 0, false) == "Point(x = 1, y = 2)", "print_class");
    check(mirror.get_string_value(mirror.get_raw_first_value("fp"), heap, 0) ==
          "function: Point.norm", "method pointer names its class");

    check(mirror.print_class(c, heap, 0, -1, 2, false) == "Chain(next = Chain(next = ...))",
          "class nesting cut at the depth limit");
    check(mirror.format_parameters().current_output_depth() == 2,
          "depth budget restored after class rendering");

    check(mirror.get_string_value(h, heap, 0) == "Handle(7)",
          "imported class without marshaller shows positional values");

    FakeMarshaller marshaller;
    ExecutionMirror foreign(executive, nullptr, &marshaller);
    std::string expected = "<foreign " + std::to_string(std::get<PointerValue>(h).handle) + ">";
    check(foreign.get_string_value(h, heap, 0) == expected, "imported class uses the marshaller");
    check(foreign.get_string_value(p, heap, 0) == "Point(x = 1, y = 2)",
          "marshaller not used for language classes");
}

static void test_property_filter() {
    std::cout << "\n--- Property Filter ---\n";

    auto filter = PropertyFilter::parse(
        "; visible fields\n"
        "Point y\n"
        "Line\n");
    check(filter != nullptr && filter->size() == 2, "filter parsed");
    check(filter && !filter->is_visible("Point", "x"), "unlisted field hidden");
    check(filter && filter->is_visible("Point", "y"), "listed field visible");
    check(filter && filter->is_visible("Line", "start"), "class without fields unfiltered");
    check(filter && filter->is_visible("Other", "z"), "unknown class unfiltered");

    check(PropertyFilter::parse("Point x\nPoint y\n") == nullptr,
          "class listed twice discards the filter");
    check(PropertyFilter::load("/nonexistent/filter.txt") == nullptr,
          "missing filter file means no filter");

    auto commas = PropertyFilter::parse("Point x, y\n");
    check(commas && commas->visible_properties("Point")->size() == 2, "comma separated fields");

    Executive executive;
    run(executive, std::string(POINT_CLASS) + "p = new Point(1, 2)\n");
    const Heap& heap = executive.memory().heap();
    StackValue p = executive.memory().get_at_relative(0);

    ExecutionMirror filtered(executive, filter);
    check(filtered.get_string_value(p, heap, 0) == "Point(y = 2)", "filtered class trace");
    check(filtered.property_filter() == filter.get(), "mirror keeps the shared filter");

    RuntimeOptions options;
    options.property_filter_path = "/nonexistent/filter.txt";
    Executive configured(options);
    run(configured, "a = 1\n");
    ExecutionMirror unfiltered(configured);
    check(unfiltered.property_filter() == nullptr, "unreadable configured filter ignored");
}

// ==============================================================================
// Core Dump Tests
// ==============================================================================

static void test_core_dump() {
    std::cout << "\n--- Core Dump ---\n";

    Executive executive;
    run(executive,
        "count = 3\n"
        "arr = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10}\n"
        "%tmp = 1\n"
        "BLOCK 1 PARENT 0\n"
        "inner = 5\n");
    ExecutionMirror mirror(executive);

    check(mirror.get_core_dump() == "count = 3\narr = { 1, 2, ..., 9, 10 }\n",
          "core dump of globals with default limits");

    std::vector<std::string> lines = mirror.get_core_dump(-1, -1);
    check(lines.size() == 2, "temporaries and nested blocks left out");
    check(lines.size() == 2 && lines[1] == "arr = { 1, 2, 3, 4, 5, 6, 7, 8, 9, 10 }",
          "explicit limits applied");

    // Default limits come back from the options
    check(mirror.get_core_dump() == "count = 3\narr = { 1, 2, ..., 9, 10 }\n",
          "core dump after explicit limits uses the options again");

    Executive unassigned;
    run(unassigned, "VAR int later\n");
    ExecutionMirror empty_mirror(unassigned);
    check(empty_mirror.get_core_dump() == "later = null\n", "unassigned global dumped as null");
}

static void test_core_dump_wrap() {
    std::cout << "\n--- Core Dump Wrapping ---\n";

    std::string long_text(2000, 'x');
    Executive executive;
    run(executive, "s = \"" + long_text + "\"\n");
    ExecutionMirror mirror(executive);

    std::string line = "s = \"" + long_text + "\"";
    std::string dump = mirror.get_core_dump();

    check(dump.size() == line.size() + 2, "one break inserted plus the final newline");
    check(dump.substr(0, 1020) == line.substr(0, 1020), "first segment is 1020 characters");
    check(dump.size() > 1020 && dump[1020] == '\n', "break after 1020 characters");
    check(!dump.empty() && dump.back() == '\n', "dump ends with a newline");
    check(dump.substr(1021, line.size() - 1020) == line.substr(1020), "rest on the next line");
}

// ==============================================================================
// Property Access Tests
// ==============================================================================

static void test_properties() {
    std::cout << "\n--- Properties ---\n";

    Executive executive;
    run(executive,
        "CLASS Box\n"
        "END\n"
        "CLASS Pair\n"
        "  FIELD var first\n"
        "  FIELD var second\n"
        "  STATIC int made\n"
        "END\n"
        "pr = new Pair(new Box(5), {1, 2})\n"
        "q = pr\n"
        "i = 1\n");
    ExecutionMirror mirror(executive);

    Obj pair = mirror.get_value("pr");
    auto properties = mirror.get_properties(pair);
    check(properties.has_value() && properties->size() == 3, "fields and statics listed");
    if (properties && properties->size() == 3) {
        check(obj_int(properties->at("first"), 5), "one-element box unwrapped");
        check(properties->at("second").array() != nullptr, "array field unpacked");
        check(obj_is_null(properties->at("made")), "unassigned static is null");
    }

    auto without_static = mirror.get_properties(pair, true);
    check(without_static && without_static->count("made") == 0, "statics excluded on request");

    auto names = mirror.get_property_names(pair);
    check(names && names->size() == 3 && (*names)[0] == "first" && (*names)[2] == "made",
          "property names in declared order");

    Obj i = mirror.get_value("i");
    check(!mirror.get_properties(i).has_value(), "scalars have no properties");
    check(!mirror.get_property_names(i).has_value(), "scalars have no property names");
    check(!mirror.get_array_elements(i).has_value(), "scalars have no elements");

    auto elements = mirror.get_array_elements(properties ? properties->at("second") : i);
    check(elements && elements->size() == 2 && obj_int((*elements)[1], 2), "array elements");

    StackValue raw = mirror.get_raw_first_value("pr");
    check(mirror.get_first_name_from_value(raw) == std::optional<std::string>("pr"),
          "first global holding the object");

    PointerValue orphan = executive.memory().heap().allocate_object(
        std::get<PointerValue>(raw).class_type, {NullValue{}, NullValue{}});
    check(!mirror.get_first_name_from_value(orphan).has_value(), "unreferenced object unnamed");

    bool caught = false;
    try {
        mirror.get_first_name_from_value(IntValue{1});
    } catch (const RuntimeError&) {
        caught = true;
    }
    check(caught, "non-pointer rejected");
}

// ==============================================================================
// Comparison Tests
// ==============================================================================

static void test_comparisons() {
    std::cout << "\n--- Comparisons ---\n";

    Executive executive;
    run(executive,
        std::string(POINT_CLASS) +
        "arr = {1, 2.5, true, \"s\", {3, 4}, null}\n"
        "p = new Point(1, 2)\n"
        "ch = 'c'\n"
        "n = 9\n");
    ExecutionMirror mirror(executive);

    Obj arr = mirror.get_value("arr");
    HostList expected{1, 2.5000001, true, "s", HostList{3, 4}, HostValue{}};
    check(arr.array() && mirror.compare_arrays(*arr.array(), expected),
          "matching array compares equal");
    check(mirror.compare_arrays("arr", expected), "comparison by name");

    HostList off_by_one{1, 2.51, true, "s", HostList{3, 4}, HostValue{}};
    check(!mirror.compare_arrays("arr", off_by_one), "double outside tolerance differs");

    HostList too_short{1, 2.5};
    check(!mirror.compare_arrays("arr", too_short), "length mismatch differs");

    HostList flat{1, 2.5, true, "s", 3, HostValue{}};
    check(!mirror.compare_arrays("arr", flat), "nesting mismatch differs");
    check(!mirror.compare_arrays("n", HostList{9}), "non-array never equals a list");

    Obj p = mirror.get_value("p");
    check(mirror.equals_host_value(p, HostProperties{{"x", 1}, {"y", 2}}),
          "instance matches its properties");
    check(!mirror.equals_host_value(p, HostProperties{{"x", 1}, {"z", 2}}),
          "unknown property never matches");
    check(mirror.equals_host_value(mirror.get_value("ch"), HostValue('c')), "char matches");
    check(!mirror.equals_host_value(mirror.get_value("n"), HostValue(9.0)),
          "int never equals a double");
    check(mirror.equals_host_value(mirror.get_value("n"), HostValue(9)), "int matches");
}

// ==============================================================================
// Watch Tests
// ==============================================================================

static void test_watch() {
    std::cout << "\n--- Watch ---\n";

    Executive executive;
    run(executive,
        "a = 5\n"
        "b = a + 1\n"
        "BLOCK 1 PARENT 0\n"
        "inner = 10\n");
    ExecutionMirror mirror(executive);

    WatchSession session;
    session.evaluate(executive, "b * 2");
    check(obj_int(mirror.get_watch_value(session), 12), "watch expression evaluated");
    check(session.watch_symbols.empty(), "watch symbols cleared after reading");
    check(session.watch_stack.empty(), "watch values released after reading");
    check(obj_is_null(mirror.get_watch_value(session)), "nothing left to read");

    executive.set_running_block(1);
    session.evaluate(executive, "inner + a");
    check(obj_int(mirror.get_watch_value(session), 15), "watch evaluated in the running block");

    WatchSession other;
    check(obj_is_null(mirror.get_watch_value(other)), "sessions do not share results");

    SymbolNode result(Constants::WATCH_RESULT_VAR,
                      ClassTable::build_primitive_type(PrimitiveType::VAR, 0),
                      Constants::INVALID_INDEX, Constants::GLOBAL_SCOPE, 0);
    other.push(result, InvalidValue{});
    check(obj_is_null(mirror.get_watch_value(other)), "unassigned watch result is null");

    other.push(result, CallingConventionValue{BounceType::EXPLICIT});
    check(obj_is_null(mirror.get_watch_value(other)), "unreadable watch result is null");

    bool caught = false;
    try {
        session.evaluate(executive, "missing + 1");
    } catch (const RuntimeError&) {
        caught = true;
    }
    check(caught, "watch on an undefined name throws");

    caught = false;
    try {
        session.evaluate(executive, "a +");
    } catch (const ParseError&) {
        caught = true;
    }
    check(caught, "malformed watch expression throws");
}

// ==============================================================================
// Mutation Tests
// ==============================================================================

static void test_set_value_and_execute() {
    std::cout << "\n--- Set Value and Execute ---\n";

    Executive executive;
    run(executive,
        "a = 5\n"
        "b = a + 1\n");
    ExecutionMirror mirror(executive);

    executive.reset_stats();
    check(mirror.set_value_and_execute("a", 10), "program replayed");
    check(obj_int(mirror.get_value("a"), 10), "new value kept");
    check(obj_int(mirror.get_value("b"), 11), "dependent recomputed");
    check(executive.get_stats().nodes_executed == 1, "only the dependent re-executed");
    check(executive.get_stats().nodes_skipped == 1, "the assigned node skipped");
    check(!executive.memory().has_frame(), "replay frames popped");
}

static void test_failed_replay() {
    std::cout << "\n--- Failed Replay ---\n";

    Executive executive;
    run(executive,
        "VAR int x\n"
        "x = 0\n"
        "a = \"y\"\n"
        "BLOCK 1 PARENT 0\n"
        "VAR int x\n"
        "x = 1\n"
        "b = \"x\" + a\n");
    ExecutionMirror mirror(executive);

    bool caught = false;
    try {
        mirror.set_value_and_execute("a", 10);
    } catch (const RuntimeError&) {
        caught = true;
    }
    check(caught, "replay of a bad concatenation throws");
    check(executive.running_block() == Constants::ROOT_BLOCK,
          "running block restored after a failed replay");
    check(!executive.memory().has_frame(), "failed replay frames popped");
    check(obj_int(mirror.get_debug_value("x"), 0), "lookups start from the root block again");
}

static void test_set_value() {
    std::cout << "\n--- Set Value ---\n";

    Executive executive;
    run(executive,
        "a = 1\n"
        "b = a + 1\n"
        "c = b * 2\n"
        "d = 7\n");
    ExecutionMirror mirror(executive);

    std::optional<int> marked = mirror.set_value("a", 10);
    check(marked == std::optional<int>(2), "transitive dependents marked dirty");
    check(obj_int(mirror.get_value("a"), 10), "value written");
    check(obj_int(mirror.get_value("b"), 2), "dependents untouched until replay");

    check(!mirror.set_value("nothere", 1).has_value(), "unknown name writes nothing");

    check(!mirror.set_value_and_execute("d", 8), "no dependents means no replay");
    check(obj_int(mirror.get_value("d"), 8), "value written even without replay");

    check(mirror.set_value_and_execute("a", 3), "replay after a new value");
    check(obj_int(mirror.get_value("b"), 4) && obj_int(mirror.get_value("c"), 8),
          "dependents recomputed from the new value");

    check(mirror.set_value_and_execute("b", 5), "replay from a middle node");
    check(obj_int(mirror.get_value("b"), 5), "middle node keeps the written value");
    check(obj_int(mirror.get_value("c"), 10), "downstream node recomputed");

    mirror.nullify_variable("a");
    check(obj_is_null(mirror.get_value("a")), "nullify writes null");
    mirror.nullify_variable("");
    check(obj_is_null(mirror.get_value("a")), "empty name ignored");

    check(mirror.set_value("c", std::nullopt) == std::optional<int>(0),
          "leaf node has no dependents");
}

// ==============================================================================
// Main
// ==============================================================================

int main() {
    std::cout << "=== Execution Mirror Tests ===\n";

    test_get_value();
    test_global_lookups();
    test_nested_block_resolution();
    test_name_errors();
    test_method_resolution();
    test_function_resolution();
    test_unpack();
    test_repack();
    test_cycles();
    test_output_format_parameters();
    test_scalar_rendering();
    test_array_rendering();
    test_class_rendering();
    test_property_filter();
    test_core_dump();
    test_core_dump_wrap();
    test_properties();
    test_comparisons();
    test_watch();
    test_set_value_and_execute();
    test_failed_replay();
    test_set_value();

    std::cout << "\n=== " << pass_count << "/" << test_count
              << " tests passed! ===\n";
    if (had_failure) {
        std::cout << "SOME TESTS FAILED\n";
        return 1;
    }
    return 0;
}
