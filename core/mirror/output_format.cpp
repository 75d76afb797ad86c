// ==============================================================================
// Output Format Parameters Implementation
// ==============================================================================

#include "output_format.hpp"

namespace dsm {

OutputFormatParameters::OutputFormatParameters(int max_array_size, int max_output_depth)
    : max_array_size_(max_array_size)
    , max_output_depth_(max_output_depth)
    , current_output_depth_(max_output_depth)
{}

bool OutputFormatParameters::continue_output_trace() {
    if (max_output_depth_ == UNBOUNDED) {
        return true;
    }

    // Stay at zero; going negative would look like "unbounded"
    if (current_output_depth_ == 0) {
        return false;
    }

    current_output_depth_--;
    return true;
}

void OutputFormatParameters::restore_output_trace_depth() {
    if (max_output_depth_ == UNBOUNDED) {
        return;
    }
    if (current_output_depth_ < max_output_depth_) {
        current_output_depth_++;
    }
}

void OutputFormatParameters::reset_output_depth() {
    current_output_depth_ = max_output_depth_;
}

}  // namespace dsm
