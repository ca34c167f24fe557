#pragma once

#include <expected>

#include "../data_io/read_errors.h"
#include "../file_format/dataset_metadata.h"
#include "slice_request.h"

namespace chunkslice::optimization {

/// Name of the environment variable forcing whole-chunk decoding when set to a non-zero integer.
constexpr auto FORCE_FILTER_ENV = "CHUNKSLICE_FORCE_FILTER";

// Process-wide switch, enabled by default.
void enable();
void disable();
void set_enabled(bool enabled);
[[nodiscard]] bool is_enabled();

/** @brief Reads CHUNKSLICE_FORCE_FILTER now; values that are not integers count as 0. */
[[nodiscard]] bool forced_by_environment();

/**
 * @brief Sets the switch for the lifetime of the object and restores the previous value.
 */
class ScopedOptimization {
public:
    explicit ScopedOptimization(bool enabled);
    ~ScopedOptimization();

    ScopedOptimization(const ScopedOptimization&) = delete;
    ScopedOptimization& operator=(const ScopedOptimization&) = delete;

private:
    bool previous_;
};

/**
 * @brief Why a request cannot take the block-level path, checked cheaply before planning.
 *
 * Looks at the switch, the environment (once per call), the steps, the byte order and the codec.
 */
[[nodiscard]] std::expected<void, NotApplicable> check_applicability(const DatasetDescriptor& descriptor,
                                                                     const SliceRequest& request);

[[nodiscard]] inline bool should_optimize(const DatasetDescriptor& descriptor, const SliceRequest& request) {
    return check_applicability(descriptor, request).has_value();
}

} // namespace chunkslice::optimization
