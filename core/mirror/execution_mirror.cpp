// ==============================================================================
// Execution Mirror Implementation
// ==============================================================================
// Name resolution, value access, unpacking, watch reads, mutation and
// comparison. Text rendering lives in mirror_trace.cpp.
// ==============================================================================

#include "execution_mirror.hpp"
#include "error.hpp"
#include "logger.hpp"
#include <cmath>
#include <type_traits>

namespace dsm {

namespace {

constexpr double DOUBLE_TOLERANCE = 0.000001;

/**
 * @brief Type name shown for a value ("int", "Point", "array", ...)
 */
std::string type_name_of(const StackValue& value, const ClassTable& classes) {
    return std::visit([&](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, IntValue>) {
            return "int";
        } else if constexpr (std::is_same_v<T, DoubleValue>) {
            return "double";
        } else if constexpr (std::is_same_v<T, BoolValue>) {
            return "bool";
        } else if constexpr (std::is_same_v<T, CharValue>) {
            return "char";
        } else if constexpr (std::is_same_v<T, StringValue>) {
            return "string";
        } else if constexpr (std::is_same_v<T, PointerValue>) {
            return classes.get_type_name(v.class_type);
        } else if constexpr (std::is_same_v<T, ArrayPointerValue>) {
            return "array";
        } else if constexpr (std::is_same_v<T, FunctionPointerValue>) {
            return "function pointer";
        } else if constexpr (std::is_same_v<T, InvalidValue> ||
                             std::is_same_v<T, NullValue> ||
                             std::is_same_v<T, DefaultArgValue> ||
                             std::is_same_v<T, BlockIndexValue> ||
                             std::is_same_v<T, CallingConventionValue>) {
            return "null";
        } else {
            static_assert(always_false_v<T>, "unhandled value kind");
        }
    }, value);
}

}  // namespace

// ==============================================================================
// Construction
// ==============================================================================

ExecutionMirror::ExecutionMirror(Executive& executive,
                                 std::shared_ptr<const PropertyFilter> filter,
                                 const ForeignMarshaller* marshaller)
    : executive_(executive)
    , filter_(std::move(filter))
    , marshaller_(marshaller)
    , format_params_(executive.options().max_array_size, executive.options().max_output_depth)
{
    if (!filter_ && executive_.options().property_filter_path) {
        filter_ = PropertyFilter::load(*executive_.options().property_filter_path);
    }
}

// ==============================================================================
// Name Resolution
// ==============================================================================

ResolvedSymbol ExecutionMirror::get_symbol_index(const std::string& name, int block_id) const {
    const Executable& exe = executive_.executable();

    int class_scope = Constants::INVALID_INDEX;
    int function_index = Constants::GLOBAL_SCOPE;
    int function_block = Constants::GLOBAL_SCOPE;

    if (executive_.debug_properties().debug_stack_frame_contains(DebugProperties::FEP_RUN)) {
        const StackFrame& frame = executive_.memory().current_frame();
        class_scope = frame.class_scope;
        function_index = frame.function_scope;
        function_block = frame.function_block;
    }

    log_debug("Resolving '{}' from block {} (class {}, function {}, function block {})",
              name, block_id, class_scope, function_index, function_block);

    if (class_scope != Constants::INVALID_INDEX) {
        const ClassNode& class_node = exe.class_table().at(class_scope);

        // A language block nested inside the method body
        if (function_index != Constants::GLOBAL_SCOPE &&
            function_block != executive_.running_block()) {
            const SymbolTable& table = exe.runtime_symbols(block_id);
            auto index = table.index_of(name, Constants::INVALID_INDEX, Constants::GLOBAL_SCOPE);
            if (index) {
                const SymbolNode& symbol = table.at(*index);
                check_array_declaration(symbol);
                return ResolvedSymbol{&symbol, *index, block_id, class_scope, false};
            }
        }

        // Method locals first, then fields visible from any method
        auto index = class_node.symbols.index_of(name, class_scope, function_index);
        if (!index) {
            index = class_node.symbols.index_of_class(name, class_scope, function_index);
        }

        if (index) {
            const SymbolNode& symbol = class_node.symbols.at(*index);
            check_array_declaration(symbol);
            bool is_member = symbol.function_index == Constants::GLOBAL_SCOPE;
            return ResolvedSymbol{&symbol, *index, block_id, class_scope, is_member};
        }

        throw NameNotFoundError(name);
    }

    const CodeBlock* search_block = &exe.code_block(block_id);
    std::optional<int> index;

    if (function_index != Constants::GLOBAL_SCOPE) {
        // A language block defined inside a function: walk up to the
        // function's own block first
        if (search_block->is_my_ancestor_block(function_block)) {
            while (search_block->id != function_block) {
                index = exe.runtime_symbols(search_block->id)
                            .index_of(name, class_scope, Constants::GLOBAL_SCOPE);
                if (index) {
                    break;
                }
                search_block = search_block->parent;
            }
        }

        if (!index) {
            index = exe.runtime_symbols(search_block->id)
                        .index_of(name, class_scope, function_index);
        }
        if (!index) {
            index = exe.runtime_symbols(search_block->id)
                        .index_of(name, class_scope, Constants::GLOBAL_SCOPE);
        }
    } else {
        index = exe.runtime_symbols(search_block->id)
                    .index_of(name, class_scope, Constants::GLOBAL_SCOPE);
    }

    // Second pass: enclosing blocks, globals only
    if (!index) {
        search_block = search_block->parent;
        while (search_block != nullptr) {
            index = exe.runtime_symbols(search_block->id)
                        .index_of(name, class_scope, Constants::GLOBAL_SCOPE);
            if (index) {
                break;
            }
            search_block = search_block->parent;
        }
    }

    if (!index) {
        throw NameNotFoundError(name);
    }

    const SymbolNode& symbol = exe.runtime_symbols(search_block->id).at(*index);
    check_array_declaration(symbol);
    return ResolvedSymbol{&symbol, *index, search_block->id, class_scope, false};
}

void ExecutionMirror::check_array_declaration(const SymbolNode& symbol) {
    if (symbol.array_sizes) {
        throw UnsupportedFeatureError(
            "Fixed-size array declaration '" + symbol.name + "' cannot be inspected");
    }
}

StackValue ExecutionMirror::read_resolved(const ResolvedSymbol& resolved) const {
    const RuntimeMemory& memory = executive_.memory();
    if (resolved.is_member_field) {
        return memory.get_member_data(*resolved.symbol);
    }
    return memory.get_symbol_value(*resolved.symbol);
}

// ==============================================================================
// Value Access
// ==============================================================================

Obj ExecutionMirror::get_value(const std::string& name, int block_id, int class_scope) const {
    const Executable& exe = executive_.executable();

    const SymbolTable* table = nullptr;
    std::optional<int> index;

    if (block_id == Constants::ROOT_BLOCK) {
        for (size_t block = 0; block < exe.code_block_count(); block++) {
            const SymbolTable& candidate = exe.runtime_symbols(static_cast<int>(block));
            index = candidate.index_of(name, class_scope, Constants::GLOBAL_SCOPE);
            if (index) {
                table = &candidate;
                break;
            }
        }
    } else if (exe.has_code_block(block_id)) {
        table = &exe.runtime_symbols(block_id);
        index = table->index_of(name, class_scope, Constants::GLOBAL_SCOPE);
    }

    if (!index) {
        throw SymbolNotFoundError(name);
    }

    const SymbolNode& symbol = table->at(*index);
    check_array_declaration(symbol);

    return unpack(executive_.memory().get_symbol_value(symbol));
}

Obj ExecutionMirror::get_debug_value(const std::string& name) const {
    ResolvedSymbol resolved = get_symbol_index(name, executive_.running_block());

    StackValue value = read_resolved(resolved);
    if (is_invalid(value)) {
        throw UninitializedVariableError(name);
    }

    return unpack(value);
}

std::string ExecutionMirror::get_type(const std::string& name) const {
    ResolvedSymbol resolved = get_symbol_index(name, executive_.running_block());
    return type_name_of(read_resolved(resolved), executive_.executable().class_table());
}

std::string ExecutionMirror::get_type(const Obj& obj) const {
    return type_name_of(obj.value, executive_.executable().class_table());
}

std::optional<std::map<std::string, Obj>> ExecutionMirror::get_properties(
    const Obj& obj, bool exclude_static) const {
    auto* pointer = std::get_if<PointerValue>(&obj.value);
    if (!pointer) {
        return std::nullopt;
    }

    const RuntimeMemory& memory = executive_.memory();
    const Heap& heap = memory.heap();
    const ClassNode& class_node = executive_.executable().class_table().at(pointer->class_type);
    const HeapObject& object = heap.to_object(obj.value);

    std::map<std::string, Obj> properties;
    for (const SymbolNode* field : class_node.fields()) {
        if (exclude_static && field->is_static) {
            continue;
        }

        StackValue value = NullValue{};
        if (field->is_static) {
            value = memory.get_at_relative(field->memory_index);
        } else if (field->memory_index >= 0 &&
                   field->memory_index < static_cast<int>(object.count())) {
            value = object.values[field->memory_index];
        }

        // Unwrap a one-element box around a scalar
        if (is_pointer(value)) {
            const HeapObject& boxed = heap.to_object(value);
            if (boxed.count() == 1 && !is_pointer(boxed.values[0]) &&
                !is_array(boxed.values[0])) {
                value = boxed.values[0];
            }
        }

        properties[field->name] = unpack(value, heap);
    }

    return properties;
}

std::optional<std::vector<std::string>> ExecutionMirror::get_property_names(
    const Obj& obj) const {
    auto* pointer = std::get_if<PointerValue>(&obj.value);
    if (!pointer) {
        return std::nullopt;
    }

    const ClassNode& class_node = executive_.executable().class_table().at(pointer->class_type);

    std::vector<std::string> names;
    for (const SymbolNode* field : class_node.fields()) {
        names.push_back(field->name);
    }
    return names;
}

std::optional<std::vector<Obj>> ExecutionMirror::get_array_elements(const Obj& obj) const {
    if (!is_array(obj.value)) {
        return std::nullopt;
    }

    const Heap& heap = executive_.memory().heap();
    const HeapArray& array = heap.to_array(obj.value);

    std::vector<Obj> elements;
    elements.reserve(array.count());
    for (const StackValue& element : array.values) {
        elements.push_back(unpack(element, heap));
    }
    return elements;
}

StackValue ExecutionMirror::get_global_value(const std::string& name, int start_block) const {
    const Executable& exe = executive_.executable();

    for (int block = start_block; block < static_cast<int>(exe.code_block_count()); block++) {
        const SymbolTable& table = exe.runtime_symbols(block);
        auto index = table.index_of(name, Constants::INVALID_INDEX, Constants::GLOBAL_SCOPE);
        if (!index) {
            continue;
        }

        const SymbolNode& symbol = table.at(*index);
        check_array_declaration(symbol);

        if (symbol.absolute_function_index == Constants::GLOBAL_SCOPE) {
            return executive_.memory().get_at_relative(symbol.memory_index);
        }
    }

    return NullValue{};
}

StackValue ExecutionMirror::get_raw_first_value(const std::string& name, int start_block,
                                                int class_scope) const {
    const Executable& exe = executive_.executable();

    for (int block = start_block; block < static_cast<int>(exe.code_block_count()); block++) {
        const SymbolTable& table = exe.runtime_symbols(block);
        auto index = table.index_of(name, class_scope, Constants::GLOBAL_SCOPE);
        if (index) {
            const SymbolNode& symbol = table.at(*index);
            check_array_declaration(symbol);
            return executive_.memory().get_symbol_value(symbol);
        }
    }

    throw NameNotFoundError(name);
}

Obj ExecutionMirror::get_first_value(const std::string& name, int start_block,
                                     int class_scope) const {
    return unpack(get_raw_first_value(name, start_block, class_scope));
}

std::optional<std::string> ExecutionMirror::get_first_name_from_value(
    const StackValue& value) const {
    auto* pointer = std::get_if<PointerValue>(&value);
    if (!pointer) {
        throw RuntimeError("Value to highlight must be a pointer, got " +
                           stack_value_to_string(value));
    }

    const std::vector<StackValue>& stack = executive_.memory().stack();
    int slot = Constants::INVALID_INDEX;
    for (size_t i = 0; i < stack.size(); i++) {
        auto handle = get_heap_handle(stack[i]);
        if (handle && *handle == pointer->handle) {
            slot = static_cast<int>(i);
            break;
        }
    }

    if (slot == Constants::INVALID_INDEX) {
        return std::nullopt;
    }

    const Executable& exe = executive_.executable();
    for (size_t block = 0; block < exe.code_block_count(); block++) {
        for (const auto& [index, symbol] : exe.runtime_symbols(static_cast<int>(block)).symbols()) {
            if (symbol.is_blank() || !symbol.is_global_scope()) {
                continue;
            }
            if (symbol.memory_index == slot) {
                return symbol.name;
            }
        }
    }

    return std::nullopt;
}

// ==============================================================================
// Unpacking
// ==============================================================================

Obj ExecutionMirror::unpack(const StackValue& value, const Heap& heap) const {
    HandlePath path;
    return unpack(value, heap, path);
}

Obj ExecutionMirror::unpack(const StackValue& value) const {
    return unpack(value, executive_.memory().heap());
}

Obj ExecutionMirror::unpack(const StackValue& value, const Heap& heap, HandlePath& path) const {
    const ClassTable& classes = executive_.executable().class_table();

    Obj obj;
    obj.value = value;

    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, InvalidValue> || std::is_same_v<T, NullValue>) {
            obj.type = ClassTable::build_primitive_type(PrimitiveType::NULL_TYPE, 0);
        } else if constexpr (std::is_same_v<T, IntValue>) {
            obj.type = ClassTable::build_primitive_type(PrimitiveType::INT, 0);
            obj.payload = v.value;
        } else if constexpr (std::is_same_v<T, DoubleValue>) {
            obj.type = ClassTable::build_primitive_type(PrimitiveType::DOUBLE, 0);
            obj.payload = v.value;
        } else if constexpr (std::is_same_v<T, BoolValue>) {
            obj.type = ClassTable::build_primitive_type(PrimitiveType::BOOL, 0);
            obj.payload = v.value;
        } else if constexpr (std::is_same_v<T, CharValue>) {
            obj.type = ClassTable::build_primitive_type(PrimitiveType::CHAR, 0);
            obj.payload = static_cast<int64_t>(v.value);
        } else if constexpr (std::is_same_v<T, StringValue>) {
            obj.type = ClassTable::build_primitive_type(PrimitiveType::STRING, 0);
            obj.payload = heap.to_string(value).value;
        } else if constexpr (std::is_same_v<T, PointerValue>) {
            obj.type = classes.build_type(v.class_type, 0);
            obj.payload = static_cast<int64_t>(v.handle);
        } else if constexpr (std::is_same_v<T, ArrayPointerValue>) {
            if (path.count(v.handle) > 0) {
                // Cycle: keep the handle instead of descending again
                obj.type = ClassTable::build_primitive_type(PrimitiveType::ARRAY,
                                                            Constants::ARBITRARY_RANK);
                obj.payload = static_cast<int64_t>(v.handle);
                return;
            }

            path.insert(v.handle);
            auto members = std::make_shared<DsasmArray>();
            for (const StackValue& element : heap.to_array(value).values) {
                members->members.push_back(unpack(element, heap, path));
            }
            path.erase(v.handle);

            // Homogeneous arrays assumed: the first member decides
            int element_type = members->members.empty()
                ? static_cast<int>(PrimitiveType::VAR)
                : classes.get_type(members->members[0].type.name);
            obj.type = classes.build_type(element_type, Constants::ARBITRARY_RANK);
            obj.payload = members;
        } else if constexpr (std::is_same_v<T, FunctionPointerValue>) {
            obj.type = ClassTable::build_primitive_type(PrimitiveType::FUNCTION_POINTER, 0);
            obj.payload = static_cast<int64_t>(v.procedure_id);
        } else if constexpr (std::is_same_v<T, DefaultArgValue> ||
                             std::is_same_v<T, BlockIndexValue> ||
                             std::is_same_v<T, CallingConventionValue>) {
            throw UnsupportedFeatureError(build_error_message(
                "Cannot unpack a value of kind ", address_type_to_string(get_address_type(value))));
        } else {
            static_assert(always_false_v<T>, "unhandled value kind");
        }
    }, value);

    return obj;
}

StackValue ExecutionMirror::repack(const Obj& obj, Heap& heap) {
    const DsasmArray* array = obj.array();
    if (!obj.type.is_indexable() || !array) {
        return obj.value;
    }

    std::vector<StackValue> values;
    values.reserve(array->members.size());
    for (const Obj& member : array->members) {
        values.push_back(repack(member, heap));
    }
    return heap.allocate_array(std::move(values));
}

Obj ExecutionMirror::null_obj() {
    Obj obj;
    obj.value = NullValue{};
    obj.type = ClassTable::build_primitive_type(PrimitiveType::NULL_TYPE, 0);
    return obj;
}

// ==============================================================================
// Watch
// ==============================================================================

Obj ExecutionMirror::get_watch_value(WatchSession& session) const {
    int count = static_cast<int>(session.watch_stack.size());

    int n = Constants::INVALID_INDEX;
    for (const SymbolNode& symbol : session.watch_symbols) {
        if (symbol.name == Constants::WATCH_RESULT_VAR) {
            n = symbol.storage_index;
            break;
        }
    }

    if (n < 0 || n >= count) {
        session.clear();
        return null_obj();
    }

    Obj result;
    try {
        const StackValue& value = session.watch_stack[n];
        result = is_invalid(value) ? null_obj() : unpack(value);
    } catch (const MirrorError& e) {
        log_warn("Watch value could not be read: {}", e.what());
        result = null_obj();
    }

    session.clear();
    return result;
}

// ==============================================================================
// Mutation
// ==============================================================================

std::optional<int> ExecutionMirror::set_value(const std::string& name,
                                              std::optional<int64_t> value) {
    Executable& exe = executive_.executable();

    GraphNode* node = exe.get_first_graph_node(name);
    if (!node) {
        log_debug("set_value: '{}' has no graph node, nothing set", name);
        return std::nullopt;
    }

    const SymbolNode& symbol =
        exe.runtime_symbols(node->target_block).at(node->target_storage_index);

    StackValue new_value = NullValue{};
    if (value) {
        new_value = IntValue{*value};
    }
    executive_.memory().set_symbol_value(symbol, new_value);

    std::vector<GraphNode*> reachable = exe.update_dependency_graph(*node);
    for (GraphNode* dependent : reachable) {
        dependent->is_dirty = true;
    }

    log_debug("set_value: {} = {}, {} dependent nodes marked dirty", name,
              stack_value_to_string(new_value), reachable.size());

    return static_cast<int>(reachable.size());
}

bool ExecutionMirror::set_value_and_execute(const std::string& name,
                                            std::optional<int64_t> value) {
    executive_.options().is_delta_execution = true;

    std::optional<int> marked = set_value(name, value);
    if (!marked || *marked == 0) {
        return false;
    }

    for (CodeBlock* block : executive_.executable().top_level_blocks()) {
        StackFrame frame;
        frame.tx = CallingConventionValue{BounceType::IMPLICIT};
        executive_.bounce(block->id, frame);
    }

    return true;
}

void ExecutionMirror::nullify_variable(const std::string& name) {
    if (!name.empty()) {
        set_value(name, std::nullopt);
    }
}

// ==============================================================================
// Comparison
// ==============================================================================

bool ExecutionMirror::compare_arrays(const DsasmArray& array, const HostList& expected) const {
    if (array.members.size() != expected.size()) {
        return false;
    }

    for (size_t i = 0; i < expected.size(); i++) {
        const Obj& member = array.members[i];
        const HostList* sub_expected = std::get_if<HostList>(&expected[i].value);
        const DsasmArray* sub_array = member.array();

        if (sub_expected && sub_array) {
            if (!compare_arrays(*sub_array, *sub_expected)) {
                return false;
            }
        } else if (!sub_expected && !sub_array) {
            if (!equals_host_value(member, expected[i])) {
                return false;
            }
        } else {
            return false;
        }
    }

    return true;
}

bool ExecutionMirror::compare_arrays(const std::string& name, const HostList& expected,
                                     int block_id) const {
    Obj obj = get_value(name, block_id);
    const DsasmArray* array = obj.array();
    if (!array) {
        return false;
    }
    return compare_arrays(*array, expected);
}

bool ExecutionMirror::equals_host_value(const Obj& obj, const HostValue& host) const {
    return std::visit([&](const auto& expected) -> bool {
        using T = std::decay_t<decltype(expected)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return is_null(obj.value);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            auto* actual = std::get_if<IntValue>(&obj.value);
            return actual && actual->value == expected;
        } else if constexpr (std::is_same_v<T, double>) {
            auto* actual = std::get_if<DoubleValue>(&obj.value);
            return actual && std::fabs(actual->value - expected) <= DOUBLE_TOLERANCE;
        } else if constexpr (std::is_same_v<T, bool>) {
            auto* actual = std::get_if<BoolValue>(&obj.value);
            return actual && actual->value == expected;
        } else if constexpr (std::is_same_v<T, char>) {
            auto* actual = std::get_if<CharValue>(&obj.value);
            return actual && actual->value == expected;
        } else if constexpr (std::is_same_v<T, std::string>) {
            auto* actual = std::get_if<std::string>(&obj.payload);
            return std::holds_alternative<StringValue>(obj.value) && actual &&
                   *actual == expected;
        } else if constexpr (std::is_same_v<T, HostList>) {
            auto elements = get_array_elements(obj);
            if (!elements || elements->size() != expected.size()) {
                return false;
            }
            for (size_t i = 0; i < expected.size(); i++) {
                if (!equals_host_value((*elements)[i], expected[i])) {
                    return false;
                }
            }
            return true;
        } else if constexpr (std::is_same_v<T, HostProperties>) {
            auto properties = get_properties(obj);
            if (!properties) {
                return false;
            }
            for (const auto& [name, value] : expected) {
                auto it = properties->find(name);
                if (it == properties->end() || !equals_host_value(it->second, value)) {
                    return false;
                }
            }
            return true;
        } else {
            static_assert(always_false_v<T>, "unhandled host value kind");
        }
    }, host.value);
}

}  // namespace dsm
