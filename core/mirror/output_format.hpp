// ==============================================================================
// Output Format Parameters
// ==============================================================================
// Traversal budget for one render: how many array elements to show before
// eliding the middle, and how many nesting levels to descend before printing
// "...". -1 means unbounded for either limit.
// ==============================================================================

#ifndef DSMIRROR_MIRROR_OUTPUT_FORMAT_HPP
#define DSMIRROR_MIRROR_OUTPUT_FORMAT_HPP

namespace dsm {

class OutputFormatParameters {
public:
    static constexpr int UNBOUNDED = -1;

    OutputFormatParameters() = default;
    OutputFormatParameters(int max_array_size, int max_output_depth);

    /**
     * @brief Ask to descend one nesting level
     *
     * With max_output_depth N, N calls in a row succeed and the next one
     * fails. A failed call consumes nothing.
     *
     * @return true if the caller may render the next level
     */
    bool continue_output_trace();

    /**
     * @brief Give back one level taken by continue_output_trace()
     */
    void restore_output_trace_depth();

    /**
     * @brief Restore the full depth budget
     */
    void reset_output_depth();

    int max_array_size() const { return max_array_size_; }
    int max_output_depth() const { return max_output_depth_; }
    int current_output_depth() const { return current_output_depth_; }

private:
    int max_array_size_ = UNBOUNDED;
    int max_output_depth_ = UNBOUNDED;
    int current_output_depth_ = UNBOUNDED;
};

}  // namespace dsm

#endif  // DSMIRROR_MIRROR_OUTPUT_FORMAT_HPP
