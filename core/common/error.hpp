// ==============================================================================
// Error Handling
// ==============================================================================
// This file defines error types and exception classes for the runtime and the
// mirror. Lookup failures carry the offending symbol name so the debugger
// surface can tell the user exactly which watch expression failed.
// ==============================================================================

#ifndef DSMIRROR_COMMON_ERROR_HPP
#define DSMIRROR_COMMON_ERROR_HPP

#include <exception>
#include <string>
#include <sstream>
#include "types.hpp"

namespace dsm {

// ==============================================================================
// Error Categories
// ==============================================================================

/**
 * @brief Different categories of errors that can occur
 *
 * - PARSE_ERROR: a program listing, options file or expression is malformed
 * - RUNTIME_ERROR: evaluation failed (bad operands, dangling handle, ...)
 * - LOOKUP_ERROR: a name does not resolve, or resolves to an unset slot
 * - UNSUPPORTED_FEATURE: a case the mirror deliberately refuses to handle
 * - FILE_ERROR: couldn't read a file
 * - INTERNAL_ERROR: bug in the runtime itself (shouldn't happen!)
 */
enum class ErrorCategory {
    PARSE_ERROR,
    RUNTIME_ERROR,
    LOOKUP_ERROR,
    UNSUPPORTED_FEATURE,
    FILE_ERROR,
    INTERNAL_ERROR
};

/**
 * @brief Convert ErrorCategory to string for display
 */
inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::PARSE_ERROR:         return "Parse Error";
        case ErrorCategory::RUNTIME_ERROR:       return "Runtime Error";
        case ErrorCategory::LOOKUP_ERROR:        return "Lookup Error";
        case ErrorCategory::UNSUPPORTED_FEATURE: return "Unsupported Feature";
        case ErrorCategory::FILE_ERROR:          return "File Error";
        case ErrorCategory::INTERNAL_ERROR:      return "Internal Error";
        default:                                 return "Unknown Error";
    }
}

// ==============================================================================
// Base Exception Class
// ==============================================================================

/**
 * @brief Base exception class for all runtime and mirror errors
 *
 * Example usage:
 *   throw MirrorError(ErrorCategory::PARSE_ERROR, "main.ds", 42,
 *                     "Unknown directive: 'VRA' (did you mean 'VAR'?)");
 *
 * This will produce:
 *   Parse Error in main.ds:42 - Unknown directive: 'VRA' (did you mean 'VAR'?)
 */
class MirrorError : public std::exception {
public:
    /**
     * @brief Construct an error with full context
     *
     * @param category What kind of error
     * @param file Which file the error is in
     * @param line Which line number (0 if unknown)
     * @param message Description of what went wrong
     */
    MirrorError(ErrorCategory category,
                const std::string& file,
                LineNumber line,
                const std::string& message)
        : category_(category)
        , file_(file)
        , line_(line)
        , message_(message)
    {
        std::ostringstream oss;
        oss << error_category_to_string(category);

        if (!file.empty()) {
            oss << " in " << file;
            if (line > 0) {
                oss << ":" << line;
            }
        }

        oss << " - " << message;
        full_message_ = oss.str();
    }

    MirrorError(ErrorCategory category, const std::string& message)
        : MirrorError(category, "", 0, message)
    {}

    const char* what() const noexcept override {
        return full_message_.c_str();
    }

    ErrorCategory category() const { return category_; }
    const std::string& file() const { return file_; }
    LineNumber line() const { return line_; }

    /**
     * @brief Get just the error message (without category/file/line)
     */
    const std::string& message() const { return message_; }

private:
    ErrorCategory category_;
    std::string file_;
    LineNumber line_;
    std::string message_;
    std::string full_message_;  // Cached formatted message
};

// ==============================================================================
// Specific Exception Types
// ==============================================================================

/**
 * @brief Parse error - couldn't understand the syntax of a listing or file
 */
class ParseError : public MirrorError {
public:
    ParseError(const std::string& file, LineNumber line, const std::string& message)
        : MirrorError(ErrorCategory::PARSE_ERROR, file, line, message)
    {}

    ParseError(const std::string& message)
        : MirrorError(ErrorCategory::PARSE_ERROR, message)
    {}
};

/**
 * @brief Runtime error - something went wrong during evaluation
 *
 * Examples:
 * - Arithmetic on a string and an array
 * - Division by zero
 * - Dereferencing a handle that is not a live heap object
 */
class RuntimeError : public MirrorError {
public:
    RuntimeError(const std::string& file, LineNumber line, const std::string& message)
        : MirrorError(ErrorCategory::RUNTIME_ERROR, file, line, message)
    {}

    RuntimeError(const std::string& message)
        : MirrorError(ErrorCategory::RUNTIME_ERROR, message)
    {}
};

/**
 * @brief File error - couldn't read a file
 */
class FileError : public MirrorError {
public:
    FileError(const std::string& file, const std::string& message)
        : MirrorError(ErrorCategory::FILE_ERROR, file, 0, message)
    {}

    FileError(const std::string& message)
        : MirrorError(ErrorCategory::FILE_ERROR, message)
    {}
};

/**
 * @brief Internal error - inconsistent runtime metadata
 */
class InternalError : public MirrorError {
public:
    InternalError(const std::string& message)
        : MirrorError(ErrorCategory::INTERNAL_ERROR, message)
    {}
};

/**
 * @brief A name does not resolve in any reachable scope
 *
 * name() is exactly the name the caller asked for.
 */
class NameNotFoundError : public MirrorError {
public:
    explicit NameNotFoundError(const std::string& name)
        : NameNotFoundError(name, "Name not found: '" + name + "'")
    {}

    const std::string& name() const { return name_; }

protected:
    NameNotFoundError(const std::string& name, const std::string& message)
        : MirrorError(ErrorCategory::LOOKUP_ERROR, message)
        , name_(name)
    {}

private:
    std::string name_;
};

/**
 * @brief A name is missing from the block symbol tables scanned by get_value
 */
class SymbolNotFoundError : public NameNotFoundError {
public:
    explicit SymbolNotFoundError(const std::string& name)
        : NameNotFoundError(name, "Cannot find symbol: " + name)
    {}
};

/**
 * @brief The symbol resolves but its slot was never assigned
 */
class UninitializedVariableError : public MirrorError {
public:
    explicit UninitializedVariableError(const std::string& name)
        : MirrorError(ErrorCategory::LOOKUP_ERROR,
                      "Variable '" + name + "' has not been assigned")
        , name_(name)
    {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/**
 * @brief A case the mirror refuses to handle
 *
 * Examples:
 * - Resolving a fixed-size array declaration
 * - Unpacking a VM register kind such as CALLING_CONVENTION
 */
class UnsupportedFeatureError : public MirrorError {
public:
    explicit UnsupportedFeatureError(const std::string& message)
        : MirrorError(ErrorCategory::UNSUPPORTED_FEATURE, message)
    {}
};

// ==============================================================================
// Error Reporting Helpers
// ==============================================================================

/**
 * @brief Build a helpful error message with context
 *
 * Example:
 *   throw RuntimeError(build_error_message(
 *       "Cannot add ", "string", " and ", "array"));
 */
template<typename... Args>
std::string build_error_message(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << args);
    return oss.str();
}

/**
 * @brief Format a suggestion for a typo
 *
 * Example:
 *   format_suggestion("VRA", "VAR")
 * Returns:
 *   "'VRA' (did you mean 'VAR'?)"
 */
inline std::string format_suggestion(const std::string& wrong, const std::string& correct) {
    return "'" + wrong + "' (did you mean '" + correct + "'?)";
}

}  // namespace dsm

#endif  // DSMIRROR_COMMON_ERROR_HPP
