// ==============================================================================
// Property Filter Implementation
// ==============================================================================

#include "property_filter.hpp"
#include "logger.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace dsm {

std::shared_ptr<const PropertyFilter> PropertyFilter::load(const FilePath& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        log_info("Property filter {} not found, showing all properties", path);
        return nullptr;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), path);
}

std::shared_ptr<const PropertyFilter> PropertyFilter::parse(const std::string& source,
                                                            const std::string& name) {
    auto filter = std::make_shared<PropertyFilter>();

    std::istringstream stream(source);
    std::string line;
    LineNumber line_num = 0;

    while (std::getline(stream, line)) {
        line_num++;

        // Trim
        size_t start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            continue;
        }
        line = line.substr(start, line.find_last_not_of(" \t\r\n") - start + 1);

        if (line[0] == ';') {
            continue;
        }

        std::replace(line.begin(), line.end(), ',', ' ');
        std::istringstream tokens(line);

        std::string class_name;
        tokens >> class_name;

        if (filter->classes_.count(class_name) > 0) {
            log_warn("Discarding property filter {}: class '{}' listed twice (line {})",
                     name, class_name, line_num);
            return nullptr;
        }

        std::vector<std::string> properties;
        std::string property;
        while (tokens >> property) {
            properties.push_back(property);
        }

        filter->classes_.emplace(class_name, std::move(properties));
    }

    log_info("Loaded property filter {} ({} classes)", name, filter->classes_.size());
    return filter;
}

const std::vector<std::string>* PropertyFilter::visible_properties(
    const std::string& class_name) const {
    auto it = classes_.find(class_name);
    if (it == classes_.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second;
}

bool PropertyFilter::is_visible(const std::string& class_name,
                                const std::string& property) const {
    const std::vector<std::string>* visible = visible_properties(class_name);
    if (!visible) {
        return true;
    }
    return std::find(visible->begin(), visible->end(), property) != visible->end();
}

}  // namespace dsm
