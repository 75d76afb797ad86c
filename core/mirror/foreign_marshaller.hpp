// ==============================================================================
// Foreign Marshaller
// ==============================================================================
// Instances of imported classes are owned by a foreign runtime. The mirror
// cannot read their fields, so it asks the marshaller of that runtime for a
// display string instead.
// ==============================================================================

#ifndef DSMIRROR_MIRROR_FOREIGN_MARSHALLER_HPP
#define DSMIRROR_MIRROR_FOREIGN_MARSHALLER_HPP

#include "stack_value.hpp"
#include <string>

namespace dsm {

class ForeignMarshaller {
public:
    virtual ~ForeignMarshaller() = default;

    /**
     * @brief Display string of an imported-class instance
     *
     * @param value A PointerValue whose class is marked IMPORTED
     */
    virtual std::string get_string_value(const StackValue& value) const = 0;
};

}  // namespace dsm

#endif  // DSMIRROR_MIRROR_FOREIGN_MARSHALLER_HPP
