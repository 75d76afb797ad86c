// ==============================================================================
// Program Loader
// ==============================================================================
// Parses program listings into an Executable. A listing declares code
// blocks, classes, procedures and variables, and holds the assignments that
// become dependency-graph nodes.
//
// Listing Format (one directive per line, '#' starts a comment):
//   BLOCK 1 PARENT 0 KIND language     open (or switch to) a code block
//   CLASS Point [IMPORTED]             open a class
//     FIELD int x                      instance field
//     STATIC int count                 static field
//     METHOD length [BLOCK 2]          open a method
//       ARG int scale                  argument of the open procedure
//       LOCAL double d                 local of the open procedure
//     END                              close the method
//   END                                close the class
//   FUNC main [BLOCK 3]                open a global function
//   VAR int[] values                   global in the current block
//   VAR int grid[3][4]                 fixed-size array declaration
//   total = count + 1                  assignment in the current block
//
// Assigning to an undeclared name declares it as a 'var' global of the
// current block.
// ==============================================================================

#ifndef DSMIRROR_RUNTIME_PROGRAM_LOADER_HPP
#define DSMIRROR_RUNTIME_PROGRAM_LOADER_HPP

#include "executable.hpp"
#include "error.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dsm {

class ProgramLoader {
public:
    ProgramLoader();

    // =========================================================================
    // Parsing
    // =========================================================================

    /**
     * @brief Parse a listing file
     *
     * @throws FileError if the file cannot be opened
     * @throws ParseError on any syntax or declaration error
     */
    void parse_file(const std::string& file_path);

    /**
     * @brief Parse a listing from a string
     *
     * @param source Listing text
     * @param name Name to use in error messages
     */
    void parse_string(const std::string& source, const std::string& name = "<string>");

    /**
     * @brief Hand over the parsed program
     *
     * The loader is left empty and ready for another listing.
     */
    std::unique_ptr<Executable> take_executable();

    /**
     * @brief Parse a single expression (for tests and watch evaluation)
     */
    static ExprPtr parse_expression(const std::string& text, const std::string& name = "<expr>",
                                    LineNumber line = 1);

private:
    std::unique_ptr<Executable> executable_;

    std::string source_name_;
    LineNumber current_line_ = 0;

    int current_block_ = Constants::ROOT_BLOCK;
    int current_class_ = Constants::INVALID_INDEX;
    int current_procedure_ = Constants::INVALID_INDEX;

    // =========================================================================
    // Directive Parsers
    // =========================================================================

    void parse_line(const std::string& line);
    void parse_block(const std::vector<std::string>& tokens);
    void parse_class(const std::vector<std::string>& tokens);
    void parse_field(const std::vector<std::string>& tokens, bool is_static);
    void parse_procedure(const std::vector<std::string>& tokens, bool is_method);
    void parse_local(const std::vector<std::string>& tokens, bool is_argument);
    void parse_end(const std::vector<std::string>& tokens);
    void parse_var(const std::vector<std::string>& tokens);
    void parse_assignment(const std::string& line);

    // =========================================================================
    // Helpers
    // =========================================================================

    void start_program();
    void finish_program();

    Type parse_type(const std::string& token);

    /**
     * @brief Split "grid[3][4]" into "grid" and {3, 4}
     */
    std::string parse_declared_name(const std::string& token,
                                    std::optional<std::vector<int>>& dimensions);

    int parse_block_id(const std::string& token);

    /**
     * @brief Optional "BLOCK id" suffix of METHOD / FUNC
     */
    int parse_body_block(const std::vector<std::string>& tokens, size_t start);

    void require_top_level(const std::string& directive);
    void expect_token_count(const std::vector<std::string>& tokens, size_t min, size_t max,
                            const std::string& usage);

    static std::vector<std::string> tokenize(const std::string& line);
    static std::string clean_line(const std::string& line);
    static bool is_identifier(const std::string& text);

    [[noreturn]] void error(const std::string& message) const;
    [[noreturn]] void error_with_suggestion(const std::string& message,
                                            const std::string& wrong,
                                            const std::string& correct) const;
};

}  // namespace dsm

#endif  // DSMIRROR_RUNTIME_PROGRAM_LOADER_HPP
