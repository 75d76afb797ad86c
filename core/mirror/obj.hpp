// ==============================================================================
// Mirror Objects
// ==============================================================================
// An Obj is a snapshot of one runtime value, built by the mirror for debugger
// and test consumers. Arrays are copied eagerly into a DsasmArray, so an Obj
// tree never aliases the live heap.
// ==============================================================================

#ifndef DSMIRROR_MIRROR_OBJ_HPP
#define DSMIRROR_MIRROR_OBJ_HPP

#include "stack_value.hpp"
#include "types.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace dsm {

struct DsasmArray;

/**
 * @brief Unpacked value
 *
 * Payload by kind:
 *   int, char                  -> int64_t (char code)
 *   pointer, function pointer  -> int64_t (heap handle / procedure id)
 *   double                     -> double
 *   bool                       -> bool
 *   string                     -> std::string
 *   array                      -> DsasmArray (or int64_t handle when the
 *                                 array was already on the unpack path)
 *   null, invalid              -> empty
 */
struct Obj {
    using Payload = std::variant<
        std::monostate,
        int64_t,
        double,
        bool,
        std::string,
        std::shared_ptr<DsasmArray>
    >;

    StackValue value = NullValue{};
    Type type;
    Payload payload;

    bool has_payload() const { return !std::holds_alternative<std::monostate>(payload); }

    const DsasmArray* array() const {
        auto* members = std::get_if<std::shared_ptr<DsasmArray>>(&payload);
        return members ? members->get() : nullptr;
    }
};

struct DsasmArray {
    std::vector<Obj> members;
};

}  // namespace dsm

#endif  // DSMIRROR_MIRROR_OBJ_HPP
