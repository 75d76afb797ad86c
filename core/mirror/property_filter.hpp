// ==============================================================================
// Property Filter
// ==============================================================================
// Restricts which fields of a class appear in class traces.
//
// File Format:
//   ; comment
//   Point x,y
//   Line start, end
//
// The first token names the class; the rest (comma or space separated) are
// the visible fields. A class with no listed fields is shown unfiltered.
//
// The filter is cosmetic: a missing or malformed file means no filtering. It
// is immutable once loaded and can be shared between mirrors.
// ==============================================================================

#ifndef DSMIRROR_MIRROR_PROPERTY_FILTER_HPP
#define DSMIRROR_MIRROR_PROPERTY_FILTER_HPP

#include "types.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dsm {

class PropertyFilter {
public:
    /**
     * @brief Load a filter file
     *
     * @return The filter, or nullptr if the file is missing or malformed
     */
    static std::shared_ptr<const PropertyFilter> load(const FilePath& path);

    /**
     * @brief Parse filter text
     *
     * @return The filter, or nullptr if the text is malformed
     */
    static std::shared_ptr<const PropertyFilter> parse(const std::string& source,
                                                       const std::string& name = "<filter>");

    /**
     * @brief Visible fields of a class, in the order the filter lists them
     *
     * @return nullptr if the class is not filtered
     */
    const std::vector<std::string>* visible_properties(const std::string& class_name) const;

    bool is_visible(const std::string& class_name, const std::string& property) const;

    size_t size() const { return classes_.size(); }

private:
    std::map<std::string, std::vector<std::string>> classes_;
};

}  // namespace dsm

#endif  // DSMIRROR_MIRROR_PROPERTY_FILTER_HPP
