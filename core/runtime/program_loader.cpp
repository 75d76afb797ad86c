// ==============================================================================
// Program Loader Implementation
// ==============================================================================

#include "program_loader.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace dsm {

namespace {

// ==============================================================================
// Expression Tokenizer
// ==============================================================================

enum class TokenKind {
    INTEGER,
    DOUBLE,
    STRING,
    CHAR,
    IDENTIFIER,
    PUNCT,
    END
};

struct Token {
    TokenKind kind = TokenKind::END;
    std::string text;
};

const char* const DIRECTIVES[] = {
    "BLOCK", "CLASS", "FIELD", "STATIC", "METHOD", "FUNC", "LOCAL", "ARG", "END", "VAR"
};

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '%';
}

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '%';
}

/**
 * @brief Recursive-descent parser for assignment right-hand sides
 *
 * Grammar:
 *   expr    := term (('+' | '-') term)*
 *   term    := unary (('*' | '/') unary)*
 *   unary   := '-' unary | primary
 *   primary := INT | DOUBLE | STRING | CHAR | true | false | null
 *            | 'new' IDENT '(' args ')'
 *            | 'function' IDENT ('.' IDENT)?
 *            | IDENT | '(' expr ')' | '{' entries '}'
 *   entries := (entry (',' entry)*)?
 *   entry   := expr (':' expr)?
 */
class ExpressionParser {
public:
    ExpressionParser(const std::string& text, const std::string& source_name, LineNumber line)
        : text_(text)
        , source_name_(source_name)
        , line_(line)
    {
        advance();
    }

    ExprPtr parse() {
        ExprPtr expr = parse_sum();
        if (current_.kind != TokenKind::END) {
            fail("Unexpected '" + current_.text + "' after expression");
        }
        return expr;
    }

private:
    const std::string& text_;
    const std::string& source_name_;
    LineNumber line_;
    size_t pos_ = 0;
    Token current_;

    [[noreturn]] void fail(const std::string& message) const {
        throw ParseError(source_name_, line_, message);
    }

    // -------------------------------------------------------------------------
    // Tokenizing
    // -------------------------------------------------------------------------

    char read_escaped(char quote) {
        char c = text_[pos_++];
        if (c != '\\') {
            return c;
        }
        if (pos_ >= text_.size()) {
            fail(std::string("Unterminated literal, missing ") + quote);
        }
        char escaped = text_[pos_++];
        switch (escaped) {
            case 'n':  return '\n';
            case 't':  return '\t';
            case 'r':  return '\r';
            case '0':  return '\0';
            case '\\': return '\\';
            case '"':  return '"';
            case '\'': return '\'';
            default:
                fail(std::string("Unknown escape sequence: \\") + escaped);
        }
    }

    void advance() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            pos_++;
        }

        current_ = Token{};
        if (pos_ >= text_.size()) {
            return;
        }

        char c = text_[pos_];
        size_t start = pos_;

        if (std::isdigit(static_cast<unsigned char>(c))) {
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                pos_++;
            }
            current_.kind = TokenKind::INTEGER;
            if (pos_ + 1 < text_.size() && text_[pos_] == '.' &&
                std::isdigit(static_cast<unsigned char>(text_[pos_ + 1]))) {
                pos_++;
                while (pos_ < text_.size() &&
                       std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                    pos_++;
                }
                current_.kind = TokenKind::DOUBLE;
            }
            current_.text = text_.substr(start, pos_ - start);
            return;
        }

        if (is_identifier_start(c)) {
            while (pos_ < text_.size() && is_identifier_char(text_[pos_])) {
                pos_++;
            }
            current_.kind = TokenKind::IDENTIFIER;
            current_.text = text_.substr(start, pos_ - start);
            return;
        }

        if (c == '"') {
            pos_++;
            std::string value;
            while (pos_ < text_.size() && text_[pos_] != '"') {
                value += read_escaped('"');
            }
            if (pos_ >= text_.size()) {
                fail("Unterminated string literal");
            }
            pos_++;
            current_.kind = TokenKind::STRING;
            current_.text = value;
            return;
        }

        if (c == '\'') {
            pos_++;
            if (pos_ >= text_.size() || text_[pos_] == '\'') {
                fail("Empty character literal");
            }
            char value = read_escaped('\'');
            if (pos_ >= text_.size() || text_[pos_] != '\'') {
                fail("Character literal must hold exactly one character");
            }
            pos_++;
            current_.kind = TokenKind::CHAR;
            current_.text = std::string(1, value);
            return;
        }

        static const std::string punctuation = "+-*/(){},:.";
        if (punctuation.find(c) != std::string::npos) {
            pos_++;
            current_.kind = TokenKind::PUNCT;
            current_.text = std::string(1, c);
            return;
        }

        fail(std::string("Unexpected character '") + c + "' in expression");
    }

    bool at_punct(const char* p) const {
        return current_.kind == TokenKind::PUNCT && current_.text == p;
    }

    void expect_punct(const char* p) {
        if (!at_punct(p)) {
            fail(std::string("Expected '") + p + "' but found " +
                 (current_.kind == TokenKind::END ? "end of line" : "'" + current_.text + "'"));
        }
        advance();
    }

    std::string expect_identifier(const char* what) {
        if (current_.kind != TokenKind::IDENTIFIER) {
            fail(std::string("Expected ") + what);
        }
        std::string name = current_.text;
        advance();
        return name;
    }

    // -------------------------------------------------------------------------
    // Grammar
    // -------------------------------------------------------------------------

    ExprPtr parse_sum() {
        ExprPtr lhs = parse_product();
        while (at_punct("+") || at_punct("-")) {
            BinaryOperator op = at_punct("+") ? BinaryOperator::ADD : BinaryOperator::SUB;
            advance();
            ExprPtr rhs = parse_product();
            lhs = make_expr(BinaryOp{op, lhs, rhs}, line_);
        }
        return lhs;
    }

    ExprPtr parse_product() {
        ExprPtr lhs = parse_unary();
        while (at_punct("*") || at_punct("/")) {
            BinaryOperator op = at_punct("*") ? BinaryOperator::MUL : BinaryOperator::DIV;
            advance();
            ExprPtr rhs = parse_unary();
            lhs = make_expr(BinaryOp{op, lhs, rhs}, line_);
        }
        return lhs;
    }

    ExprPtr parse_unary() {
        if (at_punct("-")) {
            advance();
            return make_expr(UnaryMinus{parse_unary()}, line_);
        }
        return parse_primary();
    }

    ExprPtr parse_primary() {
        Token token = current_;

        switch (token.kind) {
            case TokenKind::INTEGER:
                advance();
                try {
                    return make_expr(IntLiteral{std::stoll(token.text)}, line_);
                } catch (const std::out_of_range&) {
                    fail("Integer literal out of range: " + token.text);
                }

            case TokenKind::DOUBLE:
                advance();
                try {
                    return make_expr(DoubleLiteral{std::stod(token.text)}, line_);
                } catch (const std::out_of_range&) {
                    fail("Double literal out of range: " + token.text);
                }

            case TokenKind::STRING:
                advance();
                return make_expr(StringLiteral{token.text}, line_);

            case TokenKind::CHAR:
                advance();
                return make_expr(CharLiteral{token.text[0]}, line_);

            case TokenKind::IDENTIFIER:
                return parse_identifier();

            case TokenKind::PUNCT:
                if (token.text == "(") {
                    advance();
                    ExprPtr inner = parse_sum();
                    expect_punct(")");
                    return inner;
                }
                if (token.text == "{") {
                    return parse_array_literal();
                }
                fail("Unexpected '" + token.text + "' in expression");

            case TokenKind::END:
            default:
                fail("Expected an expression");
        }
    }

    ExprPtr parse_identifier() {
        std::string word = current_.text;
        advance();

        if (word == "true")  return make_expr(BoolLiteral{true}, line_);
        if (word == "false") return make_expr(BoolLiteral{false}, line_);
        if (word == "null")  return make_expr(NullLiteral{}, line_);

        if (word == "new") {
            NewObject node;
            node.class_name = expect_identifier("a class name after 'new'");
            expect_punct("(");
            if (!at_punct(")")) {
                node.arguments.push_back(parse_sum());
                while (at_punct(",")) {
                    advance();
                    node.arguments.push_back(parse_sum());
                }
            }
            expect_punct(")");
            return make_expr(std::move(node), line_);
        }

        if (word == "function") {
            FunctionRef node;
            node.function_name = expect_identifier("a function name after 'function'");
            if (at_punct(".")) {
                advance();
                node.class_name = node.function_name;
                node.function_name = expect_identifier("a method name after '.'");
            }
            return make_expr(std::move(node), line_);
        }

        return make_expr(SymbolRef{word}, line_);
    }

    ExprPtr parse_array_literal() {
        expect_punct("{");
        ArrayLiteral node;

        if (!at_punct("}")) {
            while (true) {
                ExprPtr entry = parse_sum();
                if (at_punct(":")) {
                    advance();
                    node.keyed.emplace_back(entry, parse_sum());
                } else {
                    node.elements.push_back(entry);
                }
                if (!at_punct(",")) {
                    break;
                }
                advance();
            }
        }

        expect_punct("}");
        return make_expr(std::move(node), line_);
    }
};

}  // namespace

// ==============================================================================
// Construction
// ==============================================================================

ProgramLoader::ProgramLoader() {
    start_program();
}

void ProgramLoader::start_program() {
    executable_ = std::make_unique<Executable>();
    executable_->add_code_block(Constants::ROOT_BLOCK, std::nullopt, CodeBlockKind::LANGUAGE);
    current_block_ = Constants::ROOT_BLOCK;
    current_class_ = Constants::INVALID_INDEX;
    current_procedure_ = Constants::INVALID_INDEX;
    current_line_ = 0;
}

// ==============================================================================
// File Loading
// ==============================================================================

void ProgramLoader::parse_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw FileError(file_path, "Could not open file for reading");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    parse_string(buffer.str(), file_path);
}

void ProgramLoader::parse_string(const std::string& source, const std::string& name) {
    source_name_ = name;
    current_line_ = 0;

    std::istringstream stream(source);
    std::string line;

    while (std::getline(stream, line)) {
        current_line_++;
        parse_line(line);
    }

    finish_program();

    log_debug("Parsed {} ({} lines)", name, current_line_);
}

std::unique_ptr<Executable> ProgramLoader::take_executable() {
    std::unique_ptr<Executable> result = std::move(executable_);
    start_program();
    return result;
}

ExprPtr ProgramLoader::parse_expression(const std::string& text, const std::string& name,
                                        LineNumber line) {
    ExpressionParser parser(text, name, line);
    return parser.parse();
}

void ProgramLoader::finish_program() {
    if (current_procedure_ != Constants::INVALID_INDEX) {
        error("Missing END for procedure '" +
              executable_->procedure(current_procedure_)->name + "'");
    }
    if (current_class_ != Constants::INVALID_INDEX) {
        error("Missing END for class '" +
              executable_->class_table().at(current_class_).name + "'");
    }
}

// ==============================================================================
// Line Parsing
// ==============================================================================

void ProgramLoader::parse_line(const std::string& line) {
    std::string cleaned = clean_line(line);
    if (cleaned.empty()) {
        return;
    }

    std::vector<std::string> tokens = tokenize(cleaned);
    const std::string& keyword = tokens[0];

    if (keyword == "BLOCK")  return parse_block(tokens);
    if (keyword == "CLASS")  return parse_class(tokens);
    if (keyword == "FIELD")  return parse_field(tokens, false);
    if (keyword == "STATIC") return parse_field(tokens, true);
    if (keyword == "METHOD") return parse_procedure(tokens, true);
    if (keyword == "FUNC")   return parse_procedure(tokens, false);
    if (keyword == "LOCAL")  return parse_local(tokens, false);
    if (keyword == "ARG")    return parse_local(tokens, true);
    if (keyword == "END")    return parse_end(tokens);
    if (keyword == "VAR")    return parse_var(tokens);

    if (cleaned.find('=') != std::string::npos) {
        return parse_assignment(cleaned);
    }

    // Directive keywords typed in the wrong case
    std::string upper = keyword;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (const char* directive : DIRECTIVES) {
        if (upper == directive) {
            error_with_suggestion("Unknown directive: ", keyword, directive);
        }
    }

    // Common misspellings
    if (upper == "VRA" || upper == "VAL")    error_with_suggestion("Unknown directive: ", keyword, "VAR");
    if (upper == "FUNCTION" || upper == "FN") error_with_suggestion("Unknown directive: ", keyword, "FUNC");
    if (upper == "ARGUMENT")                 error_with_suggestion("Unknown directive: ", keyword, "ARG");
    if (upper == "ENDCLASS" || upper == "ENDFUNC") error_with_suggestion("Unknown directive: ", keyword, "END");

    error("Unknown directive: '" + keyword + "'");
}

// ==============================================================================
// Declarations
// ==============================================================================

void ProgramLoader::parse_block(const std::vector<std::string>& tokens) {
    expect_token_count(tokens, 2, 6, "BLOCK <id> [PARENT <id>] [KIND <kind>]");
    require_top_level("BLOCK");

    int id = parse_block_id(tokens[1]);
    std::optional<int> parent;
    std::optional<CodeBlockKind> kind;

    for (size_t i = 2; i < tokens.size(); i += 2) {
        if (i + 1 >= tokens.size()) {
            error("Missing value after '" + tokens[i] + "'");
        }
        if (tokens[i] == "PARENT") {
            parent = parse_block_id(tokens[i + 1]);
        } else if (tokens[i] == "KIND") {
            const std::string& value = tokens[i + 1];
            if (value == "language") {
                kind = CodeBlockKind::LANGUAGE;
            } else if (value == "construct") {
                kind = CodeBlockKind::CONSTRUCT;
            } else if (value == "function") {
                kind = CodeBlockKind::FUNCTION;
            } else {
                error("Invalid block kind '" + value +
                      "' (expected language, construct or function)");
            }
        } else {
            error("Unexpected '" + tokens[i] + "' in BLOCK directive");
        }
    }

    int count = static_cast<int>(executable_->code_block_count());

    if (id < count) {
        // Switching back to an existing block
        const CodeBlock& existing = executable_->code_block(id);
        int existing_parent = existing.parent ? existing.parent->id : Constants::INVALID_INDEX;
        if (parent && *parent != existing_parent) {
            error(build_error_message("Block ", id, " was declared with a different parent"));
        }
        if (kind && *kind != existing.kind) {
            error(build_error_message("Block ", id, " was declared as ",
                                      code_block_kind_to_string(existing.kind)));
        }
        current_block_ = id;
        return;
    }

    if (id != count) {
        error(build_error_message("Code block ids must be consecutive: expected ", count,
                                  ", got ", id));
    }
    if (parent && *parent >= count) {
        error(build_error_message("Block ", id, " has unknown parent ", *parent));
    }

    executable_->add_code_block(id, parent, kind.value_or(CodeBlockKind::LANGUAGE));
    current_block_ = id;
}

void ProgramLoader::parse_class(const std::vector<std::string>& tokens) {
    expect_token_count(tokens, 2, 3, "CLASS <name> [IMPORTED]");
    require_top_level("CLASS");

    const std::string& name = tokens[1];
    if (!is_identifier(name)) {
        error("Invalid class name: '" + name + "'");
    }

    bool is_imported = false;
    if (tokens.size() == 3) {
        if (tokens[2] != "IMPORTED") {
            error_with_suggestion("Unexpected class modifier: ", tokens[2], "IMPORTED");
        }
        is_imported = true;
    }

    if (executable_->class_table().find(name)) {
        error("Class '" + name + "' is already defined");
    }

    current_class_ = executable_->class_table().add_class(name, is_imported);
}

void ProgramLoader::parse_field(const std::vector<std::string>& tokens, bool is_static) {
    const char* directive = is_static ? "STATIC" : "FIELD";
    expect_token_count(tokens, 3, 3, std::string(directive) + " <type> <name>");

    if (current_class_ == Constants::INVALID_INDEX) {
        error(std::string(directive) + " outside of a CLASS");
    }
    if (current_procedure_ != Constants::INVALID_INDEX) {
        error(std::string(directive) + " inside a METHOD; use LOCAL");
    }

    Type type = parse_type(tokens[1]);
    std::optional<std::vector<int>> dimensions;
    std::string name = parse_declared_name(tokens[2], dimensions);

    ClassNode& owner = executable_->class_table().at(current_class_);
    SymbolNode symbol(name, type, current_class_, Constants::GLOBAL_SCOPE, current_block_);
    symbol.array_sizes = dimensions;
    symbol.runtime_table_index = current_block_;

    if (owner.symbols.index_of(name, current_class_, Constants::GLOBAL_SCOPE)) {
        error("Field '" + name + "' is already declared in class " + owner.name);
    }

    if (is_static) {
        symbol.is_static = true;
        symbol.memory_index = executable_->allocate_global_slot();
        symbol.memory_region = MemoryRegion::STACK;
    } else {
        symbol.memory_index = owner.instance_size++;
        symbol.memory_region = MemoryRegion::HEAP;
    }

    owner.symbols.append(std::move(symbol));
}

void ProgramLoader::parse_procedure(const std::vector<std::string>& tokens, bool is_method) {
    const char* directive = is_method ? "METHOD" : "FUNC";
    expect_token_count(tokens, 2, 4, std::string(directive) + " <name> [BLOCK <id>]");

    if (current_procedure_ != Constants::INVALID_INDEX) {
        error(std::string(directive) + " inside another procedure");
    }
    if (is_method && current_class_ == Constants::INVALID_INDEX) {
        error_with_suggestion("METHOD outside of a CLASS: ", "METHOD", "FUNC");
    }
    if (!is_method && current_class_ != Constants::INVALID_INDEX) {
        error_with_suggestion("FUNC inside a CLASS: ", "FUNC", "METHOD");
    }

    const std::string& name = tokens[1];
    if (!is_identifier(name)) {
        error("Invalid procedure name: '" + name + "'");
    }

    int class_scope = is_method ? current_class_ : Constants::INVALID_INDEX;
    if (executable_->find_procedure(name, class_scope)) {
        error("Procedure '" + name + "' is already defined");
    }

    ProcedureNode procedure;
    procedure.name = name;
    procedure.class_scope = class_scope;
    procedure.block_id = parse_body_block(tokens, 2);

    current_procedure_ = executable_->add_procedure(std::move(procedure));
}

void ProgramLoader::parse_local(const std::vector<std::string>& tokens, bool is_argument) {
    const char* directive = is_argument ? "ARG" : "LOCAL";
    expect_token_count(tokens, 3, 3, std::string(directive) + " <type> <name>");

    if (current_procedure_ == Constants::INVALID_INDEX) {
        error(std::string(directive) + " outside of a METHOD or FUNC");
    }

    Type type = parse_type(tokens[1]);
    std::optional<std::vector<int>> dimensions;
    std::string name = parse_declared_name(tokens[2], dimensions);

    ProcedureNode& procedure = *executable_->procedure(current_procedure_);
    SymbolTable& table = procedure.class_scope != Constants::INVALID_INDEX
        ? executable_->class_table().at(procedure.class_scope).symbols
        : executable_->runtime_symbols(procedure.block_id);

    if (table.index_of(name, procedure.class_scope, procedure.id)) {
        error("'" + name + "' is already declared in procedure " + procedure.name);
    }

    SymbolNode symbol(name, type, procedure.class_scope, procedure.id, procedure.block_id);
    symbol.array_sizes = dimensions;
    symbol.is_argument = is_argument;
    symbol.memory_index = procedure.local_count++;
    symbol.memory_region = MemoryRegion::STACK;
    symbol.runtime_table_index = procedure.block_id;

    table.append(std::move(symbol));
}

void ProgramLoader::parse_end(const std::vector<std::string>& tokens) {
    expect_token_count(tokens, 1, 1, "END");

    if (current_procedure_ != Constants::INVALID_INDEX) {
        current_procedure_ = Constants::INVALID_INDEX;
    } else if (current_class_ != Constants::INVALID_INDEX) {
        current_class_ = Constants::INVALID_INDEX;
    } else {
        error("END without CLASS, METHOD or FUNC");
    }
}

void ProgramLoader::parse_var(const std::vector<std::string>& tokens) {
    expect_token_count(tokens, 3, 3, "VAR <type> <name>");
    require_top_level("VAR");

    Type type = parse_type(tokens[1]);
    std::optional<std::vector<int>> dimensions;
    std::string name = parse_declared_name(tokens[2], dimensions);

    SymbolTable& table = executable_->runtime_symbols(current_block_);
    if (table.index_of(name, Constants::INVALID_INDEX, Constants::GLOBAL_SCOPE)) {
        error(build_error_message("Variable '", name, "' is already declared in block ",
                                  current_block_));
    }

    SymbolNode symbol(name, type, Constants::INVALID_INDEX, Constants::GLOBAL_SCOPE,
                      current_block_);
    symbol.array_sizes = dimensions;
    symbol.memory_index = executable_->allocate_global_slot();
    symbol.memory_region = MemoryRegion::STACK;
    symbol.runtime_table_index = current_block_;

    table.append(std::move(symbol));
}

// ==============================================================================
// Assignments
// ==============================================================================

void ProgramLoader::parse_assignment(const std::string& line) {
    if (current_class_ != Constants::INVALID_INDEX ||
        current_procedure_ != Constants::INVALID_INDEX) {
        error("Assignments are only allowed outside CLASS and FUNC bodies");
    }

    size_t equals = line.find('=');
    std::string target = line.substr(0, equals);
    target.erase(0, target.find_first_not_of(" \t"));
    target.erase(target.find_last_not_of(" \t") + 1);

    if (!is_identifier(target)) {
        error("Invalid assignment target: '" + target + "'");
    }

    std::string rhs = line.substr(equals + 1);
    if (rhs.find_first_not_of(" \t") == std::string::npos) {
        error("Missing expression after '='");
    }

    ExprPtr expression = parse_expression(rhs, source_name_, current_line_);

    // The target resolves like a read: innermost declaring block wins
    const CodeBlock* block = &executable_->code_block(current_block_);
    int target_block = Constants::INVALID_INDEX;
    std::optional<int> storage_index;

    for (; block != nullptr; block = block->parent) {
        storage_index = executable_->runtime_symbols(block->id)
                            .index_of(target, Constants::INVALID_INDEX, Constants::GLOBAL_SCOPE);
        if (storage_index) {
            target_block = block->id;
            break;
        }
    }

    if (!storage_index) {
        SymbolNode symbol(target, ClassTable::build_primitive_type(PrimitiveType::VAR, 0),
                          Constants::INVALID_INDEX, Constants::GLOBAL_SCOPE, current_block_);
        symbol.memory_index = executable_->allocate_global_slot();
        symbol.memory_region = MemoryRegion::STACK;
        symbol.runtime_table_index = current_block_;

        storage_index = executable_->runtime_symbols(current_block_).append(std::move(symbol));
        target_block = current_block_;
    }

    executable_->add_graph_node(current_block_, target, target_block, *storage_index,
                                std::move(expression), current_line_);
}

// ==============================================================================
// Helpers
// ==============================================================================

Type ProgramLoader::parse_type(const std::string& token) {
    size_t bracket = token.find('[');
    std::string base = token.substr(0, bracket);

    int rank = 0;
    if (bracket != std::string::npos) {
        std::string suffix = token.substr(bracket);
        if (suffix == "[]..[]") {
            rank = Constants::ARBITRARY_RANK;
        } else {
            for (size_t i = 0; i < suffix.size(); i += 2) {
                if (suffix.compare(i, 2, "[]") != 0) {
                    error("Invalid array type: '" + token + "'");
                }
                rank++;
            }
        }
    }

    auto type_id = executable_->class_table().find(base);
    if (!type_id) {
        if (base == "integer") error_with_suggestion("Unknown type: ", base, "int");
        if (base == "float")   error_with_suggestion("Unknown type: ", base, "double");
        if (base == "boolean") error_with_suggestion("Unknown type: ", base, "bool");
        error("Unknown type: '" + base + "'");
    }

    return executable_->class_table().build_type(*type_id, rank);
}

std::string ProgramLoader::parse_declared_name(const std::string& token,
                                               std::optional<std::vector<int>>& dimensions) {
    size_t bracket = token.find('[');
    std::string name = token.substr(0, bracket);
    if (!is_identifier(name)) {
        error("Invalid name: '" + name + "'");
    }

    if (bracket == std::string::npos) {
        dimensions.reset();
        return name;
    }

    std::vector<int> sizes;
    size_t pos = bracket;
    while (pos < token.size()) {
        size_t close = token.find(']', pos);
        if (token[pos] != '[' || close == std::string::npos) {
            error("Invalid array declaration: '" + token + "'");
        }
        std::string digits = token.substr(pos + 1, close - pos - 1);
        if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                           [](unsigned char c) { return std::isdigit(c); })) {
            error("Invalid array size in '" + token + "'");
        }
        try {
            sizes.push_back(std::stoi(digits));
        } catch (const std::out_of_range&) {
            error("Array size out of range in '" + token + "'");
        }
        pos = close + 1;
    }

    dimensions = sizes;
    return name;
}

int ProgramLoader::parse_block_id(const std::string& token) {
    if (token.empty() || !std::all_of(token.begin(), token.end(),
                                      [](unsigned char c) { return std::isdigit(c); })) {
        error("Invalid block id: '" + token + "'");
    }
    try {
        return std::stoi(token);
    } catch (const std::out_of_range&) {
        error("Block id out of range: " + token);
    }
}

int ProgramLoader::parse_body_block(const std::vector<std::string>& tokens, size_t start) {
    if (tokens.size() <= start) {
        return current_block_;
    }
    if (tokens[start] != "BLOCK" || tokens.size() != start + 2) {
        error("Expected 'BLOCK <id>' after the procedure name");
    }

    int id = parse_block_id(tokens[start + 1]);
    if (!executable_->has_code_block(id)) {
        error(build_error_message("Unknown code block ", id));
    }
    return id;
}

void ProgramLoader::require_top_level(const std::string& directive) {
    if (current_procedure_ != Constants::INVALID_INDEX) {
        error(directive + " inside a procedure body");
    }
    if (current_class_ != Constants::INVALID_INDEX) {
        error(directive + " inside a CLASS body");
    }
}

void ProgramLoader::expect_token_count(const std::vector<std::string>& tokens, size_t min,
                                       size_t max, const std::string& usage) {
    if (tokens.size() < min || tokens.size() > max) {
        error("Malformed directive, expected: " + usage);
    }
}

std::vector<std::string> ProgramLoader::tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;

    while (stream >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

std::string ProgramLoader::clean_line(const std::string& line) {
    // '#' starts a comment unless it sits inside a string or char literal
    std::string result;
    char quote = 0;
    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quote) {
            result += c;
            if (c == '\\' && i + 1 < line.size()) {
                result += line[++i];
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '#') {
            break;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        }
        result += c;
    }

    size_t start = result.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = result.find_last_not_of(" \t\r\n");
    return result.substr(start, end - start + 1);
}

bool ProgramLoader::is_identifier(const std::string& text) {
    if (text.empty() || !is_identifier_start(text[0])) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), is_identifier_char);
}

void ProgramLoader::error(const std::string& message) const {
    throw ParseError(source_name_, current_line_, message);
}

void ProgramLoader::error_with_suggestion(const std::string& message,
                                          const std::string& wrong,
                                          const std::string& correct) const {
    throw ParseError(source_name_, current_line_, message + format_suggestion(wrong, correct));
}

}  // namespace dsm
