// ==============================================================================
// Expression Representation
// ==============================================================================
// This file defines how we represent the right-hand side of an assignment.
// Each expression from a program listing becomes a tree of Expr nodes that
// the executive evaluates directly. Subtrees are shared immutably, so graph
// nodes can be copied without copying their expressions.
// ==============================================================================

#ifndef DSMIRROR_RUNTIME_EXPRESSION_HPP
#define DSMIRROR_RUNTIME_EXPRESSION_HPP

#include "types.hpp"
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace dsm {

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

// ==============================================================================
// Literals
// ==============================================================================

struct IntLiteral {
    int64_t value;
};

struct DoubleLiteral {
    double value;
};

struct BoolLiteral {
    bool value;
};

struct NullLiteral {};

struct CharLiteral {
    char value;
};

/**
 * @brief A string literal
 *
 * Evaluation boxes a fresh heap string every time.
 */
struct StringLiteral {
    std::string value;
};

// ==============================================================================
// References
// ==============================================================================

/**
 * @brief Read of a named variable
 *
 * Example: "b = a + 1" reads "a"
 */
struct SymbolRef {
    std::string name;
};

/**
 * @brief Reference to a procedure: function foo, function Point.length
 */
struct FunctionRef {
    std::string class_name;     // empty for global functions
    std::string function_name;
};

// ==============================================================================
// Constructors
// ==============================================================================

/**
 * @brief Array literal: { 1, 2, "key" : 3 }
 *
 * Entries with an integer key are stored positionally; any other key goes to
 * the array's keyed part.
 */
struct ArrayLiteral {
    std::vector<ExprPtr> elements;
    std::vector<std::pair<ExprPtr, ExprPtr>> keyed;
};

/**
 * @brief Instance creation: new Point(1, 2)
 *
 * Arguments fill the instance fields in declared order. A class without
 * declared fields keeps the arguments as positional values.
 */
struct NewObject {
    std::string class_name;
    std::vector<ExprPtr> arguments;
};

// ==============================================================================
// Operators
// ==============================================================================

struct UnaryMinus {
    ExprPtr operand;
};

enum class BinaryOperator {
    ADD,
    SUB,
    MUL,
    DIV
};

struct BinaryOp {
    BinaryOperator op;
    ExprPtr lhs;
    ExprPtr rhs;
};

// ==============================================================================
// Expr - Unified Expression Node
// ==============================================================================

struct Expr {
    std::variant<
        IntLiteral,
        DoubleLiteral,
        BoolLiteral,
        NullLiteral,
        CharLiteral,
        StringLiteral,
        SymbolRef,
        FunctionRef,
        ArrayLiteral,
        NewObject,
        UnaryMinus,
        BinaryOp
    > node;

    // For error messages: where the expression came from
    LineNumber source_line = 0;
};

template<typename Node>
ExprPtr make_expr(Node node, LineNumber source_line) {
    auto expr = std::make_shared<Expr>();
    expr->node = std::move(node);
    expr->source_line = source_line;
    return expr;
}

// ==============================================================================
// Helper Functions
// ==============================================================================

/**
 * @brief Names of all variables an expression reads, in first-use order
 *
 * These become the dependency edges of the graph node that owns the
 * expression.
 */
std::vector<std::string> collect_symbol_reads(const Expr& expr);

/**
 * @brief Convert an expression back to listing syntax
 *
 * Example: BinaryOp{ADD, SymbolRef{a}, IntLiteral{1}} -> "(a + 1)"
 */
std::string expression_to_string(const Expr& expr);

const char* binary_operator_to_string(BinaryOperator op);

}  // namespace dsm

#endif  // DSMIRROR_RUNTIME_EXPRESSION_HPP
