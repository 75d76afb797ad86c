// ==============================================================================
// Common Type Definitions
// ==============================================================================
// This file defines basic types used throughout the runtime and the mirror.
// Using explicit types makes the code more readable and helps catch bugs.
// ==============================================================================

#ifndef DSMIRROR_COMMON_TYPES_HPP
#define DSMIRROR_COMMON_TYPES_HPP

#include <cstddef>      // For size_t
#include <cstdint>      // For fixed-width integer types
#include <string>       // For std::string
#include <vector>       // For std::vector
#include <optional>     // For std::optional (values that might not exist)

namespace dsm {  // dsm = DesignScript mirror namespace

// ==============================================================================
// Scope Constants
// ==============================================================================

/**
 * Reserved identifiers shared by symbol tables, stack frames and the mirror.
 *
 * Class scopes, function indices and code block ids are plain integers.
 * GLOBAL_SCOPE and INVALID_INDEX are deliberately the same value: a symbol
 * outside any function has function index GLOBAL_SCOPE, a symbol outside any
 * class has class scope INVALID_INDEX, and both compare equal to -1.
 */
namespace Constants {
    constexpr int GLOBAL_SCOPE = -1;
    constexpr int INVALID_INDEX = -1;

    // Rank of an array whose nesting depth is not known statically
    constexpr int ARBITRARY_RANK = -1;

    // The outermost code block of every program
    constexpr int ROOT_BLOCK = 0;

    // Core dump lines are hard wrapped at this many characters
    constexpr size_t CORE_DUMP_LINE_WIDTH = 1020;

    // Name of the watch result slot inside a watch session
    constexpr const char* WATCH_RESULT_VAR = "%__watch_result";
}

// ==============================================================================
// Heap Handles
// ==============================================================================

/**
 * @brief Opaque address of a heap object (string, array or class instance)
 */
using HeapHandle = int64_t;

// ==============================================================================
// Value Kinds
// ==============================================================================

/**
 * @brief Kind tag of a runtime value
 *
 * Every runtime value carries exactly one of these kinds:
 * - INVALID: declared but never assigned
 * - NULL_VALUE: the language null
 * - INT, DOUBLE, BOOLEAN, CHAR: immediate scalars
 * - STRING, POINTER, ARRAY_POINTER: handles into the heap
 * - FUNCTION_POINTER: index into the procedure table
 * - DEFAULT_ARG, BLOCK_INDEX, CALLING_CONVENTION: VM register kinds that
 *   never represent user data
 */
enum class AddressType {
    INVALID,
    NULL_VALUE,
    INT,
    DOUBLE,
    BOOLEAN,
    CHAR,
    STRING,
    POINTER,
    ARRAY_POINTER,
    FUNCTION_POINTER,
    DEFAULT_ARG,
    BLOCK_INDEX,
    CALLING_CONVENTION
};

/**
 * @brief Built-in type ids
 *
 * User classes are registered after MAX_PRIMITIVES, so any class id at or
 * above MAX_PRIMITIVES names a user (or imported) class.
 */
enum class PrimitiveType {
    VOID,
    NULL_TYPE,
    VAR,
    INT,
    DOUBLE,
    BOOL,
    CHAR,
    STRING,
    ARRAY,
    POINTER,
    FUNCTION_POINTER,
    MAX_PRIMITIVES
};

/**
 * @brief Semantic type of a mirrored value
 *
 * rank is 0 for scalars, the nesting depth for arrays, or ARBITRARY_RANK.
 */
struct Type {
    std::string name;
    int uid = static_cast<int>(PrimitiveType::VAR);
    int rank = 0;

    bool is_indexable() const { return rank != 0; }

    bool operator==(const Type& other) const {
        return uid == other.uid && rank == other.rank;
    }
    bool operator!=(const Type& other) const { return !(*this == other); }
};

// ==============================================================================
// Symbol Attributes
// ==============================================================================

enum class AccessModifier {
    PUBLIC,
    PROTECTED,
    PRIVATE
};

enum class MemoryRegion {
    INVALID,
    STACK,
    HEAP
};

// ==============================================================================
// Utility Type Aliases
// ==============================================================================

/**
 * @brief Source line number (program listings, options files, filter files)
 */
using LineNumber = size_t;

/**
 * @brief File path
 */
using FilePath = std::string;

// ==============================================================================
// Helper Functions
// ==============================================================================

/**
 * @brief Convert AddressType to string for error messages and logs
 *
 * @param type The value kind
 * @return Upper-case name (e.g., "ARRAY_POINTER")
 */
const char* address_type_to_string(AddressType type);

/**
 * @brief Lower-case language name of a built-in type ("int", "var", ...)
 */
const char* primitive_type_to_string(PrimitiveType type);

}  // namespace dsm

#endif  // DSMIRROR_COMMON_TYPES_HPP
