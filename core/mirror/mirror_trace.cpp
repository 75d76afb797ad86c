// ==============================================================================
// Execution Mirror - Text Rendering
// ==============================================================================
// Value rendering for watch windows, print statements and core dumps.
//
// Every array and class trace takes one level from the format parameters
// before descending and gives it back on the way out, so a render leaves the
// depth budget exactly as it found it. Heap handles on the current path are
// tracked so cyclic arrays and objects terminate.
// ==============================================================================

#include "execution_mirror.hpp"
#include "error.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <type_traits>

namespace dsm {

namespace {

/**
 * @brief Gives back one trace level when it goes out of scope
 */
class TraceLevel {
public:
    explicit TraceLevel(OutputFormatParameters& params) : params_(params) {}
    ~TraceLevel() { params_.restore_output_trace_depth(); }

    TraceLevel(const TraceLevel&) = delete;
    TraceLevel& operator=(const TraceLevel&) = delete;

private:
    OutputFormatParameters& params_;
};

}  // namespace

// ==============================================================================
// Public Entry Points
// ==============================================================================

std::string ExecutionMirror::get_string_value(const StackValue& value, const Heap& heap,
                                              int block_id, bool for_print) {
    HandlePath path;
    return string_value(value, heap, block_id, for_print, path);
}

std::string ExecutionMirror::get_string_value(const StackValue& value, const Heap& heap,
                                              int block_id, int max_array_size,
                                              int max_output_depth, bool for_print) {
    format_params_ = OutputFormatParameters(max_array_size, max_output_depth);
    return get_string_value(value, heap, block_id, for_print);
}

std::string ExecutionMirror::print_class(const StackValue& value, const Heap& heap,
                                         int block_id, bool for_print) {
    return get_class_trace(value, heap, block_id, for_print);
}

std::string ExecutionMirror::print_class(const StackValue& value, const Heap& heap,
                                         int block_id, int max_array_size,
                                         int max_output_depth, bool for_print) {
    format_params_ = OutputFormatParameters(max_array_size, max_output_depth);
    return get_class_trace(value, heap, block_id, for_print);
}

std::string ExecutionMirror::get_class_trace(const StackValue& value, const Heap& heap,
                                             int block_id, bool for_print) {
    HandlePath path;
    return class_trace(value, heap, block_id, for_print, path);
}

std::string ExecutionMirror::get_array_trace(const StackValue& value, const Heap& heap,
                                             int block_id, bool for_print) {
    HandlePath path;
    if (auto* array = std::get_if<ArrayPointerValue>(&value)) {
        path.insert(array->handle);
    }
    return array_trace(value, heap, block_id, for_print, path);
}

// ==============================================================================
// Value Rendering
// ==============================================================================

std::string ExecutionMirror::string_value(const StackValue& value, const Heap& heap,
                                          int block_id, bool for_print, HandlePath& path) {
    return std::visit([&](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, IntValue>) {
            return std::to_string(v.value);
        } else if constexpr (std::is_same_v<T, DoubleValue>) {
            return fmt::format("{:.6f}", v.value);
        } else if constexpr (std::is_same_v<T, BoolValue>) {
            return v.value ? "true" : "false";
        } else if constexpr (std::is_same_v<T, CharValue>) {
            std::string character(1, v.value);
            return for_print ? character : "'" + character + "'";
        } else if constexpr (std::is_same_v<T, StringValue>) {
            const std::string& text = heap.to_string(value).value;
            return for_print ? text : "\"" + text + "\"";
        } else if constexpr (std::is_same_v<T, PointerValue>) {
            return class_trace(value, heap, block_id, for_print, path);
        } else if constexpr (std::is_same_v<T, ArrayPointerValue>) {
            return pointer_trace(value, heap, block_id, for_print, path);
        } else if constexpr (std::is_same_v<T, FunctionPointerValue>) {
            return "function: " + function_name(v.procedure_id);
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

std::string ExecutionMirror::function_name(int procedure_id) const {
    const Executable& exe = executive_.executable();
    const ProcedureNode* procedure = exe.procedure(procedure_id);
    if (!procedure) {
        return std::to_string(procedure_id);
    }

    if (procedure->class_scope != Constants::INVALID_INDEX) {
        return exe.class_table().get_type_name(procedure->class_scope) + "." + procedure->name;
    }
    return procedure->name;
}

// ==============================================================================
// Arrays
// ==============================================================================

std::string ExecutionMirror::pointer_trace(const StackValue& value, const Heap& heap,
                                           int block_id, bool for_print, HandlePath& path) {
    HeapHandle handle = std::get<ArrayPointerValue>(value).handle;
    if (path.count(handle) > 0) {
        return "{ ... }";
    }

    path.insert(handle);
    std::string elements = array_trace(value, heap, block_id, for_print, path);
    path.erase(handle);

    if (for_print) {
        return "{" + elements + "}";
    }
    return "{ " + elements + " }";
}

std::string ExecutionMirror::array_trace(const StackValue& value, const Heap& heap,
                                         int block_id, bool for_print, HandlePath& path) {
    if (!format_params_.continue_output_trace()) {
        return "...";
    }
    TraceLevel level(format_params_);

    const HeapArray& array = heap.to_array(value);
    int count = static_cast<int>(array.count());

    // Elide the middle: show [0, half) and [count - half, count)
    int half = -1;
    int max_array_size = format_params_.max_array_size();
    if (max_array_size > 0 && count > max_array_size) {
        half = max_array_size / 2;
    }

    const char* separator = for_print ? "," : ", ";
    std::string elements;

    for (int n = 0; n < count; n++) {
        if (!elements.empty()) {
            elements += separator;
        }

        elements += string_value(array.values[n], heap, block_id, for_print, path);

        if (half > 0 && n == half - 1) {
            elements += ", ...";
            n = count - half - 1;
        }
    }

    // Keyed entries; only the last half are shown when truncating
    std::vector<const std::pair<StackValue, StackValue>*> keyed;
    for (const auto& entry : array.keyed) {
        if (!std::holds_alternative<IntValue>(entry.first)) {
            keyed.push_back(&entry);
        }
    }

    int start_index = half > 0 ? static_cast<int>(keyed.size()) - half : 0;
    for (int index = std::max(start_index, 0); index < static_cast<int>(keyed.size()); index++) {
        if (!elements.empty()) {
            elements += separator;
        }

        elements += string_value(keyed[index]->first, heap, block_id, for_print, path);
        elements += "=";
        elements += string_value(keyed[index]->second, heap, block_id, for_print, path);
    }

    return elements;
}

// ==============================================================================
// Classes
// ==============================================================================

std::string ExecutionMirror::class_trace(const StackValue& value, const Heap& heap,
                                         int block_id, bool for_print, HandlePath& path) {
    if (!format_params_.continue_output_trace()) {
        return "...";
    }
    TraceLevel level(format_params_);

    const ClassTable& classes = executive_.executable().class_table();
    auto* pointer = std::get_if<PointerValue>(&value);
    if (!pointer || !classes.contains(pointer->class_type)) {
        return "";
    }

    const ClassNode& class_node = classes.at(pointer->class_type);
    if (class_node.is_imported && marshaller_) {
        return marshaller_->get_string_value(value);
    }

    if (path.count(pointer->handle) > 0) {
        return "...";
    }
    path.insert(pointer->handle);

    const HeapObject& object = heap.to_object(value);
    const std::vector<std::string>* visible =
        filter_ ? filter_->visible_properties(class_node.name) : nullptr;

    std::string trace;
    std::vector<const SymbolNode*> fields = class_node.fields();

    if (!fields.empty()) {
        bool first_property = true;
        for (const SymbolNode* field : fields) {
            if (visible && std::find(visible->begin(), visible->end(), field->name) ==
                               visible->end()) {
                continue;
            }

            if (!first_property) {
                trace += ", ";
            }

            StackValue field_value = NullValue{};
            if (field->is_static) {
                field_value = executive_.memory().get_at_relative(field->memory_index);
            } else if (field->memory_index >= 0 &&
                       field->memory_index < static_cast<int>(object.count())) {
                field_value = object.values[field->memory_index];
            }

            trace += field->name + " = " +
                     string_value(field_value, heap, block_id, for_print, path);
            first_property = false;
        }
    } else {
        // No declared fields: positional values
        for (size_t n = 0; n < object.count(); n++) {
            if (n != 0) {
                trace += ", ";
            }
            trace += string_value(object.values[n], heap, block_id, for_print, path);
        }
    }

    path.erase(pointer->handle);

    if (pointer->class_type >= static_cast<int>(PrimitiveType::MAX_PRIMITIVES)) {
        if (for_print) {
            return class_node.name + "{" + trace + "}";
        }
        return class_node.name + "(" + trace + ")";
    }

    return trace;
}

// ==============================================================================
// Core Dump
// ==============================================================================

std::vector<std::string> ExecutionMirror::global_var_trace() {
    std::vector<std::string> lines;

    const Executable& exe = executive_.executable();
    if (exe.code_block_count() == 0) {
        return lines;
    }

    // Only the outermost block: symbols of nested blocks are out of scope
    const RuntimeMemory& memory = executive_.memory();
    const SymbolTable& table = exe.runtime_symbols(Constants::ROOT_BLOCK);

    for (const auto& [index, symbol] : table.symbols()) {
        format_params_.reset_output_depth();

        if (symbol.is_blank()) {
            continue;
        }

        bool is_local = symbol.function_index != Constants::GLOBAL_SCOPE;
        bool is_static = symbol.class_scope != Constants::INVALID_INDEX && symbol.is_static;
        if (symbol.is_argument || is_local || is_static || symbol.is_temp) {
            continue;
        }

        StackValue value = memory.get_symbol_value(symbol);
        HandlePath path;
        lines.push_back(symbol.name + " = " +
                        string_value(value, memory.heap(), Constants::ROOT_BLOCK, false, path));
    }

    format_params_.reset_output_depth();
    return lines;
}

std::vector<std::string> ExecutionMirror::get_core_dump(int max_array_size,
                                                        int max_output_depth) {
    format_params_ = OutputFormatParameters(max_array_size, max_output_depth);
    return global_var_trace();
}

std::string ExecutionMirror::get_core_dump() {
    const RuntimeOptions& options = executive_.options();
    format_params_ = OutputFormatParameters(options.max_array_size, options.max_output_depth);

    std::string dump;
    for (std::string line : global_var_trace()) {
        while (line.size() > Constants::CORE_DUMP_LINE_WIDTH) {
            dump += line.substr(0, Constants::CORE_DUMP_LINE_WIDTH);
            dump += "\n";
            line.erase(0, Constants::CORE_DUMP_LINE_WIDTH);
        }
        dump += line;
        dump += "\n";
    }
    return dump;
}

}  // namespace dsm
