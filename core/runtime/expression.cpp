// ==============================================================================
// Expression Helper Functions
// ==============================================================================

#include "expression.hpp"
#include <algorithm>
#include <sstream>
#include <type_traits>

namespace dsm {

namespace {

void collect_reads(const Expr& expr, std::vector<std::string>& names) {
    std::visit([&names](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, SymbolRef>) {
            if (std::find(names.begin(), names.end(), node.name) == names.end()) {
                names.push_back(node.name);
            }
        } else if constexpr (std::is_same_v<T, ArrayLiteral>) {
            for (const auto& element : node.elements) {
                collect_reads(*element, names);
            }
            for (const auto& [key, value] : node.keyed) {
                collect_reads(*key, names);
                collect_reads(*value, names);
            }
        } else if constexpr (std::is_same_v<T, NewObject>) {
            for (const auto& argument : node.arguments) {
                collect_reads(*argument, names);
            }
        } else if constexpr (std::is_same_v<T, UnaryMinus>) {
            collect_reads(*node.operand, names);
        } else if constexpr (std::is_same_v<T, BinaryOp>) {
            collect_reads(*node.lhs, names);
            collect_reads(*node.rhs, names);
        }
    }, expr.node);
}

void write_expression(const Expr& expr, std::ostringstream& oss) {
    std::visit([&oss](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, IntLiteral> || std::is_same_v<T, DoubleLiteral>) {
            oss << node.value;
        } else if constexpr (std::is_same_v<T, BoolLiteral>) {
            oss << (node.value ? "true" : "false");
        } else if constexpr (std::is_same_v<T, NullLiteral>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, CharLiteral>) {
            oss << "'" << node.value << "'";
        } else if constexpr (std::is_same_v<T, StringLiteral>) {
            oss << "\"" << node.value << "\"";
        } else if constexpr (std::is_same_v<T, SymbolRef>) {
            oss << node.name;
        } else if constexpr (std::is_same_v<T, FunctionRef>) {
            oss << "function ";
            if (!node.class_name.empty()) {
                oss << node.class_name << ".";
            }
            oss << node.function_name;
        } else if constexpr (std::is_same_v<T, ArrayLiteral>) {
            oss << "{";
            bool first = true;
            for (const auto& element : node.elements) {
                oss << (first ? " " : ", ");
                write_expression(*element, oss);
                first = false;
            }
            for (const auto& [key, value] : node.keyed) {
                oss << (first ? " " : ", ");
                write_expression(*key, oss);
                oss << " : ";
                write_expression(*value, oss);
                first = false;
            }
            oss << (first ? "}" : " }");
        } else if constexpr (std::is_same_v<T, NewObject>) {
            oss << "new " << node.class_name << "(";
            for (size_t i = 0; i < node.arguments.size(); i++) {
                if (i > 0) oss << ", ";
                write_expression(*node.arguments[i], oss);
            }
            oss << ")";
        } else if constexpr (std::is_same_v<T, UnaryMinus>) {
            oss << "-";
            write_expression(*node.operand, oss);
        } else if constexpr (std::is_same_v<T, BinaryOp>) {
            oss << "(";
            write_expression(*node.lhs, oss);
            oss << " " << binary_operator_to_string(node.op) << " ";
            write_expression(*node.rhs, oss);
            oss << ")";
        } else {
            static_assert(std::is_same_v<T, void>, "unhandled expression node");
        }
    }, expr.node);
}

}  // namespace

std::vector<std::string> collect_symbol_reads(const Expr& expr) {
    std::vector<std::string> names;
    collect_reads(expr, names);
    return names;
}

std::string expression_to_string(const Expr& expr) {
    std::ostringstream oss;
    write_expression(expr, oss);
    return oss.str();
}

const char* binary_operator_to_string(BinaryOperator op) {
    switch (op) {
        case BinaryOperator::ADD: return "+";
        case BinaryOperator::SUB: return "-";
        case BinaryOperator::MUL: return "*";
        case BinaryOperator::DIV: return "/";
        default:                  return "?";
    }
}

}  // namespace dsm
