// ==============================================================================
// Runtime Options
// ==============================================================================
// Settings shared by the executive and the mirror: where the optional
// visible-property filter lives, default rendering limits, and whether
// execution replays only dirty dependency-graph nodes.
//
// Options files are plain text, one "key = value" per line:
//
//   # rendering
//   max_array_size = 4
//   max_output_depth = -1
//   property_filter = /etc/dsmirror/filter.txt
//   delta_execution = false
//   log_level = notice
// ==============================================================================

#ifndef DSMIRROR_COMMON_OPTIONS_HPP
#define DSMIRROR_COMMON_OPTIONS_HPP

#include "types.hpp"
#include "logger.hpp"
#include <string>
#include <optional>

namespace dsm {

struct RuntimeOptions {
    // Default limits used by get_core_dump() and the one-argument renderers
    static constexpr int DEFAULT_MAX_ARRAY_SIZE = 4;
    static constexpr int DEFAULT_MAX_OUTPUT_DEPTH = -1;

    // Path of the visible-property filter file (absent = no filtering)
    std::optional<FilePath> property_filter_path;

    int max_array_size = DEFAULT_MAX_ARRAY_SIZE;
    int max_output_depth = DEFAULT_MAX_OUTPUT_DEPTH;

    // When set, the executive skips dependency-graph nodes that are clean
    bool is_delta_execution = false;

    LogLevel log_level = LogLevel::NOTICE;

    /**
     * @brief Load options from a file, overriding the current values
     *
     * @throws FileError if the file cannot be opened
     * @throws ParseError on unknown keys or malformed values
     */
    void load_file(const std::string& file_path);

    /**
     * @brief Load options from a string
     *
     * @param source Options text
     * @param name Name to use in error messages
     */
    void load_string(const std::string& source, const std::string& name = "<options>");

    /**
     * @brief Apply log_level to the process-wide logger
     */
    void apply_log_level() const;
};

}  // namespace dsm

#endif  // DSMIRROR_COMMON_OPTIONS_HPP
