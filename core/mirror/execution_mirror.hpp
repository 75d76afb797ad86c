// ==============================================================================
// Execution Mirror
// ==============================================================================
// Debugger-facing view of a paused executive. The mirror:
// - Resolves bare names the way the language scopes them, using the block
//   tree and the live stack frame
// - Unpacks raw runtime values into Obj trees, and repacks them
// - Renders values as bounded text for watch windows, print and core dumps
// - Writes new values into dataflow variables and replays what depends on them
//
// One mirror binds to one executive. All calls assume the executive is
// quiescent (paused at a breakpoint or between top-level runs).
// ==============================================================================

#ifndef DSMIRROR_MIRROR_EXECUTION_MIRROR_HPP
#define DSMIRROR_MIRROR_EXECUTION_MIRROR_HPP

#include "executive.hpp"
#include "foreign_marshaller.hpp"
#include "host_value.hpp"
#include "obj.hpp"
#include "output_format.hpp"
#include "property_filter.hpp"
#include "watch_session.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dsm {

// ==============================================================================
// Resolved Symbol
// ==============================================================================

/**
 * @brief Result of name resolution
 */
struct ResolvedSymbol {
    const SymbolNode* symbol = nullptr;
    int storage_index = Constants::INVALID_INDEX;

    // Block whose table owns the symbol (for class symbols: the block the
    // lookup started from)
    int block_id = Constants::ROOT_BLOCK;

    int class_scope = Constants::INVALID_INDEX;

    // Read through the frame's this pointer (or the static slot)
    bool is_member_field = false;
};

// ==============================================================================
// Execution Mirror Class
// ==============================================================================

class ExecutionMirror {
public:
    /**
     * @brief Bind a mirror to an executive
     *
     * @param filter Property filter; when null, the filter file named by the
     *               executive's options (if any) is loaded
     * @param marshaller Renders imported-class instances; may be null
     */
    explicit ExecutionMirror(Executive& executive,
                             std::shared_ptr<const PropertyFilter> filter = nullptr,
                             const ForeignMarshaller* marshaller = nullptr);

    // =========================================================================
    // Name Resolution
    // =========================================================================

    /**
     * @brief Find the symbol a name refers to, starting from block_id
     *
     * Inside a function entered through its entry point, the top frame's
     * class and function scopes take part in the lookup: method locals
     * shadow fields, and fields are visible from every method.
     *
     * @throws NameNotFoundError if no reachable scope declares the name
     * @throws UnsupportedFeatureError for fixed-size array declarations
     */
    ResolvedSymbol get_symbol_index(const std::string& name, int block_id) const;

    // =========================================================================
    // Value Access
    // =========================================================================

    /**
     * @brief Value of a global
     *
     * With block_id 0 every block's table is searched in order; otherwise
     * only the given block's.
     *
     * @throws SymbolNotFoundError if no table declares the name
     */
    Obj get_value(const std::string& name, int block_id = Constants::ROOT_BLOCK,
                  int class_scope = Constants::INVALID_INDEX) const;

    /**
     * @brief Value of a name as seen from the current block and frame
     *
     * @throws NameNotFoundError if the name does not resolve
     * @throws UninitializedVariableError if it was never assigned
     */
    Obj get_debug_value(const std::string& name) const;

    /**
     * @brief Type name of a name's current value ("int", "Point", "array", ...)
     */
    std::string get_type(const std::string& name) const;
    std::string get_type(const Obj& obj) const;

    /**
     * @brief Field values of a class instance
     *
     * A field holding a one-element box around a scalar is unwrapped.
     *
     * @return std::nullopt unless obj is a pointer
     */
    std::optional<std::map<std::string, Obj>> get_properties(const Obj& obj,
                                                             bool exclude_static = false) const;

    std::optional<std::vector<std::string>> get_property_names(const Obj& obj) const;

    /**
     * @return std::nullopt unless obj is an array
     */
    std::optional<std::vector<Obj>> get_array_elements(const Obj& obj) const;

    /**
     * @brief Raw value of the first global named name, from start_block on
     *
     * @return NullValue if no block declares it
     */
    StackValue get_global_value(const std::string& name,
                                int start_block = Constants::ROOT_BLOCK) const;

    /**
     * @throws NameNotFoundError if no block from start_block on declares it
     */
    StackValue get_raw_first_value(const std::string& name,
                                   int start_block = Constants::ROOT_BLOCK,
                                   int class_scope = Constants::INVALID_INDEX) const;

    Obj get_first_value(const std::string& name, int start_block = Constants::ROOT_BLOCK,
                        int class_scope = Constants::INVALID_INDEX) const;

    /**
     * @brief Name of the first global holding the same heap object
     *
     * @throws RuntimeError unless value is a pointer
     * @return std::nullopt if no global holds it
     */
    std::optional<std::string> get_first_name_from_value(const StackValue& value) const;

    // =========================================================================
    // Unpacking
    // =========================================================================

    /**
     * @brief Convert a raw value into an Obj, resolving arrays in heap
     *
     * Arrays already on the current unpack path (cycles) become an array
     * Obj carrying the handle instead of members.
     *
     * @throws UnsupportedFeatureError for VM register kinds
     */
    Obj unpack(const StackValue& value, const Heap& heap) const;

    /**
     * @brief unpack() against the executive's own heap
     */
    Obj unpack(const StackValue& value) const;

    /**
     * @brief Rebuild heap arrays from an unpacked array Obj
     *
     * Non-array values come back unchanged.
     */
    static StackValue repack(const Obj& obj, Heap& heap);

    // =========================================================================
    // Text Rendering
    // =========================================================================

    /**
     * @brief Render a value with the mirror's current limits
     *
     * @param for_print Terse form for print statements (no quotes, no spaces)
     */
    std::string get_string_value(const StackValue& value, const Heap& heap, int block_id,
                                 bool for_print = false);

    /**
     * @brief Render a value with new limits (kept for later calls)
     */
    std::string get_string_value(const StackValue& value, const Heap& heap, int block_id,
                                 int max_array_size, int max_output_depth,
                                 bool for_print = false);

    std::string print_class(const StackValue& value, const Heap& heap, int block_id,
                            bool for_print);
    std::string print_class(const StackValue& value, const Heap& heap, int block_id,
                            int max_array_size, int max_output_depth, bool for_print);

    /**
     * @brief Render a class instance: Point(x = 1, y = 2)
     */
    std::string get_class_trace(const StackValue& value, const Heap& heap, int block_id,
                                bool for_print);

    /**
     * @brief Render the elements of an array without the enclosing braces
     *
     * @throws RuntimeError unless value is an array
     */
    std::string get_array_trace(const StackValue& value, const Heap& heap, int block_id,
                                bool for_print);

    /**
     * @brief "name = value" for every global of the outermost block
     *
     * Lines are not wrapped.
     */
    std::vector<std::string> get_core_dump(int max_array_size, int max_output_depth);

    /**
     * @brief Core dump with the executive's default limits
     *
     * Every line ends in '\n'; lines longer than 1020 characters continue on
     * the next line.
     */
    std::string get_core_dump();

    const OutputFormatParameters& format_parameters() const { return format_params_; }

    // =========================================================================
    // Watch
    // =========================================================================

    /**
     * @brief Unpacked result of the session's last watch evaluation
     *
     * The session is cleared afterwards. Missing, unassigned or unreadable
     * results give a null Obj.
     */
    Obj get_watch_value(WatchSession& session) const;

    // =========================================================================
    // Mutation
    // =========================================================================

    /**
     * @brief Overwrite a dataflow variable and mark its dependents dirty
     *
     * @param value New integer value, or std::nullopt for null
     * @return Number of graph nodes marked dirty, or std::nullopt if no
     *         graph node assigns name (nothing was written)
     */
    std::optional<int> set_value(const std::string& name, std::optional<int64_t> value);

    /**
     * @brief set_value(), then replay every top-level block in delta mode
     *
     * Errors raised by the replay propagate.
     *
     * @return true if the program was replayed
     */
    bool set_value_and_execute(const std::string& name, std::optional<int64_t> value);

    void nullify_variable(const std::string& name);

    // =========================================================================
    // Comparison
    // =========================================================================

    /**
     * @brief Compare an unpacked array with host values, element by element
     *
     * Doubles compare within 1e-6.
     */
    bool compare_arrays(const DsasmArray& array, const HostList& expected) const;

    bool compare_arrays(const std::string& name, const HostList& expected,
                        int block_id = Constants::ROOT_BLOCK) const;

    bool equals_host_value(const Obj& obj, const HostValue& host) const;

    const PropertyFilter* property_filter() const { return filter_.get(); }

private:
    Executive& executive_;
    std::shared_ptr<const PropertyFilter> filter_;
    const ForeignMarshaller* marshaller_;
    OutputFormatParameters format_params_;

    // Heap handles on the current render / unpack path
    using HandlePath = std::set<HeapHandle>;

    // =========================================================================
    // Helpers
    // =========================================================================

    StackValue read_resolved(const ResolvedSymbol& resolved) const;

    Obj unpack(const StackValue& value, const Heap& heap, HandlePath& path) const;

    std::string string_value(const StackValue& value, const Heap& heap, int block_id,
                             bool for_print, HandlePath& path);
    std::string class_trace(const StackValue& value, const Heap& heap, int block_id,
                            bool for_print, HandlePath& path);
    std::string pointer_trace(const StackValue& value, const Heap& heap, int block_id,
                              bool for_print, HandlePath& path);
    std::string array_trace(const StackValue& value, const Heap& heap, int block_id,
                            bool for_print, HandlePath& path);
    std::string function_name(int procedure_id) const;

    std::vector<std::string> global_var_trace();

    static void check_array_declaration(const SymbolNode& symbol);
    static Obj null_obj();
};

}  // namespace dsm

#endif  // DSMIRROR_MIRROR_EXECUTION_MIRROR_HPP
