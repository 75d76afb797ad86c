// ==============================================================================
// Executive Implementation
// ==============================================================================
// Runs programs by bouncing through code blocks and evaluating each graph
// node's expression tree.
// ==============================================================================

#include "executive.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "program_loader.hpp"
#include <algorithm>
#include <type_traits>

namespace dsm {

namespace {

// Pops the bounce frame on every exit path, including a failed evaluation
class FrameScope {
public:
    explicit FrameScope(RuntimeMemory& memory) : memory_(memory) {}
    ~FrameScope() { memory_.pop_frame(); }

    FrameScope(const FrameScope&) = delete;
    FrameScope& operator=(const FrameScope&) = delete;

private:
    RuntimeMemory& memory_;
};

// Restores the running block when a bounce unwinds
class RunningBlockScope {
public:
    RunningBlockScope(int& running_block, int block_id)
        : running_block_(running_block), previous_(running_block) {
        running_block_ = block_id;
    }
    ~RunningBlockScope() { running_block_ = previous_; }

    RunningBlockScope(const RunningBlockScope&) = delete;
    RunningBlockScope& operator=(const RunningBlockScope&) = delete;

private:
    int& running_block_;
    int previous_;
};

bool is_numeric(const StackValue& value) {
    return std::holds_alternative<IntValue>(value) || std::holds_alternative<DoubleValue>(value);
}

double to_double(const StackValue& value) {
    if (auto* i = std::get_if<IntValue>(&value)) {
        return static_cast<double>(i->value);
    }
    return std::get<DoubleValue>(value).value;
}

}  // namespace

// ==============================================================================
// Constructor
// ==============================================================================

Executive::Executive(RuntimeOptions options)
    : options_(std::move(options))
{}

// ==============================================================================
// Program Loading
// ==============================================================================

void Executive::load_file(const std::string& file_path) {
    ProgramLoader loader;
    loader.parse_file(file_path);
    install(loader.take_executable(), file_path);
}

void Executive::load_string(const std::string& source, const std::string& name) {
    ProgramLoader loader;
    loader.parse_string(source, name);
    install(loader.take_executable(), name);
}

void Executive::install(std::unique_ptr<Executable> executable, const std::string& name) {
    executable_ = std::move(executable);
    source_name_ = name;
    function_frame_depth_ = 0;
    debug_properties_.set_flag(DebugProperties::FEP_RUN, false);
    reset();

    log_info("Loaded {}: {} code blocks, {} classes, {} procedures, {} graph nodes, {} globals",
             name, executable_->code_block_count(), executable_->class_table().size(),
             executable_->procedure_count(), executable_->graph_node_count(),
             executable_->global_size());
}

void Executive::reset() {
    memory_.reset();
    function_frame_depth_ = 0;
    debug_properties_.set_flag(DebugProperties::FEP_RUN, false);
    running_block_ = Constants::ROOT_BLOCK;
    stats_.reset();

    if (!executable_) {
        return;
    }

    memory_.allocate_globals(executable_->global_size());
    for (size_t id = 0; id < executable_->code_block_count(); id++) {
        for (auto& node : executable_->code_block(static_cast<int>(id)).nodes) {
            node.is_dirty = true;
        }
    }
}

const Executable& Executive::executable() const {
    if (!executable_) {
        throw RuntimeError("No program loaded");
    }
    return *executable_;
}

Executable& Executive::executable() {
    if (!executable_) {
        throw RuntimeError("No program loaded");
    }
    return *executable_;
}

// ==============================================================================
// Execution Control
// ==============================================================================

void Executive::execute() {
    for (CodeBlock* block : executable().top_level_blocks()) {
        StackFrame frame;
        bounce(block->id, frame);
    }
}

void Executive::bounce(int block_id, StackFrame frame) {
    CodeBlock& block = executable().code_block(block_id);

    memory_.push_frame(std::move(frame), 0);
    FrameScope scope(memory_);

    run_block(block);
}

void Executive::run_block(CodeBlock& block) {
    RunningBlockScope block_scope(running_block_, block.id);
    stats_.bounces++;

    log_debug("Bounce into block {} ({}, {} nodes, delta={})", block.id,
              code_block_kind_to_string(block.kind), block.nodes.size(),
              options_.is_delta_execution);

    for (auto& node : block.nodes) {
        if (options_.is_delta_execution && !node.is_dirty) {
            stats_.nodes_skipped++;
            continue;
        }
        execute_node(node);
    }

    for (CodeBlock* child : block.children) {
        if (child->kind == CodeBlockKind::FUNCTION) {
            continue;
        }
        run_block(*child);
    }
}

void Executive::execute_node(GraphNode& node) {
    StackValue value = evaluate(*node.expression, node.block_id);

    const SymbolNode& target =
        executable_->runtime_symbols(node.target_block).at(node.target_storage_index);
    memory_.set_symbol_value(target, value);

    node.is_dirty = false;
    stats_.nodes_executed++;

    log_debug("  [{}] {} = {} -> {}", node.uid, node.target,
              expression_to_string(*node.expression), stack_value_to_string(value));
}

void Executive::set_running_block(int block_id) {
    if (!executable().has_code_block(block_id)) {
        throw RuntimeError(build_error_message("Unknown code block ", block_id));
    }
    running_block_ = block_id;
}

// ==============================================================================
// Function Frames
// ==============================================================================

void Executive::enter_function_frame(int procedure_id, const StackValue& this_ptr) {
    const ProcedureNode* procedure = executable().procedure(procedure_id);
    if (!procedure) {
        throw RuntimeError(build_error_message("Unknown procedure id ", procedure_id));
    }

    StackFrame frame;
    frame.class_scope = procedure->class_scope;
    frame.function_scope = procedure->id;
    frame.function_block = procedure->block_id;
    frame.this_ptr = this_ptr;
    memory_.push_frame(frame, procedure->local_count);

    function_frame_depth_++;
    debug_properties_.set_flag(DebugProperties::FEP_RUN, true);
    running_block_ = procedure->block_id;

    log_debug("Entered {} (procedure {}, block {}, {} locals)", procedure->name,
              procedure->id, procedure->block_id, procedure->local_count);
}

void Executive::leave_function_frame() {
    if (function_frame_depth_ == 0) {
        throw RuntimeError("No function frame to leave");
    }

    memory_.pop_frame();
    function_frame_depth_--;

    if (function_frame_depth_ == 0) {
        debug_properties_.set_flag(DebugProperties::FEP_RUN, false);
        running_block_ = Constants::ROOT_BLOCK;
    } else {
        running_block_ = memory_.current_frame().function_block;
    }
}

// ==============================================================================
// Expression Evaluation
// ==============================================================================

const SymbolNode* Executive::resolve_read(const std::string& name, int block_id) const {
    const CodeBlock* block = &executable_->code_block(block_id);
    while (block != nullptr) {
        const SymbolTable& table = executable_->runtime_symbols(block->id);
        auto index = table.index_of(name, Constants::INVALID_INDEX, Constants::GLOBAL_SCOPE);
        if (index) {
            return &table.at(*index);
        }
        block = block->parent;
    }
    return nullptr;
}

StackValue Executive::evaluate(const Expr& expr, int block_id) {
    LineNumber line = expr.source_line;
    Heap& heap = memory_.heap();

    return std::visit([&](const auto& node) -> StackValue {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, IntLiteral>) {
            return IntValue{node.value};
        } else if constexpr (std::is_same_v<T, DoubleLiteral>) {
            return DoubleValue{node.value};
        } else if constexpr (std::is_same_v<T, BoolLiteral>) {
            return BoolValue{node.value};
        } else if constexpr (std::is_same_v<T, NullLiteral>) {
            return NullValue{};
        } else if constexpr (std::is_same_v<T, CharLiteral>) {
            return CharValue{node.value};
        } else if constexpr (std::is_same_v<T, StringLiteral>) {
            return heap.allocate_string(node.value);
        } else if constexpr (std::is_same_v<T, SymbolRef>) {
            const SymbolNode* symbol = resolve_read(node.name, block_id);
            if (!symbol) {
                throw RuntimeError(source_name_, line, "Undefined variable '" + node.name + "'");
            }
            StackValue value = memory_.get_symbol_value(*symbol);
            // Reading an unassigned variable yields null
            if (is_invalid(value)) {
                return NullValue{};
            }
            return value;
        } else if constexpr (std::is_same_v<T, FunctionRef>) {
            int class_scope = Constants::INVALID_INDEX;
            if (!node.class_name.empty()) {
                auto class_id = executable_->class_table().find(node.class_name);
                if (!class_id) {
                    throw RuntimeError(source_name_, line, "Unknown class '" + node.class_name + "'");
                }
                class_scope = *class_id;
            }
            auto procedure = executable_->find_procedure(node.function_name, class_scope);
            if (!procedure) {
                throw RuntimeError(source_name_, line,
                                   "Unknown function '" + node.function_name + "'");
            }
            return FunctionPointerValue{*procedure};
        } else if constexpr (std::is_same_v<T, ArrayLiteral>) {
            std::vector<StackValue> values;
            values.reserve(node.elements.size());
            for (const auto& element : node.elements) {
                values.push_back(evaluate(*element, block_id));
            }

            ArrayPointerValue array = heap.allocate_array(std::move(values));
            for (const auto& [key_expr, value_expr] : node.keyed) {
                StackValue key = evaluate(*key_expr, block_id);
                StackValue value = evaluate(*value_expr, block_id);
                if (auto* index = std::get_if<IntValue>(&key)) {
                    if (index->value < 0) {
                        throw RuntimeError(source_name_, line, build_error_message(
                            "Negative array index ", index->value));
                    }
                    heap.set_array_element(array, static_cast<size_t>(index->value), value);
                } else {
                    heap.set_keyed_element(array, key, value);
                }
            }
            return array;
        } else if constexpr (std::is_same_v<T, NewObject>) {
            auto class_id = executable_->class_table().find(node.class_name);
            if (!class_id) {
                throw RuntimeError(source_name_, line, "Unknown class '" + node.class_name + "'");
            }
            const ClassNode& class_node = executable_->class_table().at(*class_id);

            std::vector<StackValue> arguments;
            for (const auto& argument : node.arguments) {
                arguments.push_back(evaluate(*argument, block_id));
            }

            if (class_node.instance_size == 0) {
                return heap.allocate_object(*class_id, std::move(arguments));
            }

            if (static_cast<int>(arguments.size()) > class_node.instance_size) {
                throw RuntimeError(source_name_, line, build_error_message(
                    "Class '", class_node.name, "' has ", class_node.instance_size,
                    " fields, got ", arguments.size(), " arguments"));
            }
            std::vector<StackValue> fields(static_cast<size_t>(class_node.instance_size),
                                           NullValue{});
            std::copy(arguments.begin(), arguments.end(), fields.begin());
            return heap.allocate_object(*class_id, std::move(fields));
        } else if constexpr (std::is_same_v<T, UnaryMinus>) {
            StackValue operand = evaluate(*node.operand, block_id);
            if (auto* i = std::get_if<IntValue>(&operand)) return IntValue{-i->value};
            if (auto* d = std::get_if<DoubleValue>(&operand)) return DoubleValue{-d->value};
            if (is_null(operand)) return NullValue{};
            throw RuntimeError(source_name_, line, "Cannot negate " + stack_value_to_string(operand));
        } else if constexpr (std::is_same_v<T, BinaryOp>) {
            StackValue lhs = evaluate(*node.lhs, block_id);
            StackValue rhs = evaluate(*node.rhs, block_id);
            return evaluate_binary(node.op, lhs, rhs, line);
        } else {
            static_assert(always_false_v<T>, "unhandled expression node");
        }
    }, expr.node);
}

StackValue Executive::evaluate_binary(BinaryOperator op, const StackValue& lhs,
                                      const StackValue& rhs, LineNumber line) {
    // Arithmetic involving null propagates null
    if (is_null(lhs) || is_null(rhs)) {
        return NullValue{};
    }

    auto* left_int = std::get_if<IntValue>(&lhs);
    auto* right_int = std::get_if<IntValue>(&rhs);
    if (left_int && right_int && op != BinaryOperator::DIV) {
        switch (op) {
            case BinaryOperator::ADD: return IntValue{left_int->value + right_int->value};
            case BinaryOperator::SUB: return IntValue{left_int->value - right_int->value};
            case BinaryOperator::MUL: return IntValue{left_int->value * right_int->value};
            default: break;
        }
    }

    if (is_numeric(lhs) && is_numeric(rhs)) {
        double a = to_double(lhs);
        double b = to_double(rhs);
        switch (op) {
            case BinaryOperator::ADD: return DoubleValue{a + b};
            case BinaryOperator::SUB: return DoubleValue{a - b};
            case BinaryOperator::MUL: return DoubleValue{a * b};
            case BinaryOperator::DIV: return DoubleValue{a / b};
        }
    }

    if (op == BinaryOperator::ADD &&
        std::holds_alternative<StringValue>(lhs) && std::holds_alternative<StringValue>(rhs)) {
        Heap& heap = memory_.heap();
        std::string joined = heap.to_string(lhs).value + heap.to_string(rhs).value;
        return heap.allocate_string(joined);
    }

    throw RuntimeError(source_name_, line, build_error_message(
        "Cannot apply '", binary_operator_to_string(op), "' to ",
        address_type_to_string(get_address_type(lhs)), " and ",
        address_type_to_string(get_address_type(rhs))));
}

}  // namespace dsm
