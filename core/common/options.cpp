// ==============================================================================
// Runtime Options - Implementation
// ==============================================================================

#include "options.hpp"
#include "error.hpp"
#include <fstream>
#include <iterator>
#include <sstream>

namespace dsm {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

int parse_int(const std::string& value, const std::string& key,
              const std::string& source_name, LineNumber line_num) {
    try {
        size_t pos = 0;
        int result = std::stoi(value, &pos);
        if (pos == value.size()) {
            return result;
        }
    } catch (const std::exception&) {
        // Fall through to the parse error below
    }
    throw ParseError(source_name, line_num,
                     "Invalid integer for '" + key + "': '" + value + "'");
}

bool parse_bool(const std::string& value, const std::string& key,
                const std::string& source_name, LineNumber line_num) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw ParseError(source_name, line_num,
                     "Invalid boolean for '" + key + "': '" + value + "'");
}

}  // namespace

void RuntimeOptions::load_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw FileError(file_path, "Cannot open options file");
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    load_string(content, file_path);
}

void RuntimeOptions::load_string(const std::string& source, const std::string& name) {
    std::istringstream stream(source);
    std::string line;
    LineNumber line_num = 0;

    while (std::getline(stream, line)) {
        line_num++;

        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            throw ParseError(name, line_num,
                             "Expected 'key = value', got: '" + line + "'");
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (key == "property_filter") {
            if (value.empty()) {
                property_filter_path.reset();
            } else {
                property_filter_path = value;
            }
        } else if (key == "max_array_size") {
            max_array_size = parse_int(value, key, name, line_num);
        } else if (key == "max_output_depth") {
            max_output_depth = parse_int(value, key, name, line_num);
        } else if (key == "delta_execution") {
            is_delta_execution = parse_bool(value, key, name, line_num);
        } else if (key == "log_level") {
            if (!parse_log_level(value, log_level)) {
                throw ParseError(name, line_num,
                                 "Invalid log level: '" + value + "'");
            }
        } else {
            throw ParseError(name, line_num, "Unknown option: '" + key + "'");
        }
    }
}

void RuntimeOptions::apply_log_level() const {
    set_log_level(log_level);
}

}  // namespace dsm
