#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <variant>
#include <vector>

#include "../data_io/read_errors.h"
#include "../geometry/coords.h"
#include "slice_request.h"

namespace chunkslice {

/// Selects one position and drops the axis from the result. Negative values count from the end.
struct Index {
    int64_t value = 0;
};

/// Python-style slice; bounds are clamped to the axis, `step` must be at least 1.
struct Slice {
    std::optional<int64_t> start;
    std::optional<int64_t> stop;
    int64_t step = 1;

    static Slice all() { return {}; }
    static Slice range(int64_t start, int64_t stop, int64_t step = 1) { return {start, stop, step}; }
};

using Selector = std::variant<Index, Slice>;
using Selection = std::vector<Selector>;

/// A selection resolved against a dataset shape.
struct ResolvedSelection {
    SliceRequest request;
    // Output shape with the indexed axes removed
    Coords result_shape;
};

/**
 * @brief Turns per-axis selectors into a request; axes without a selector are taken whole.
 *
 * Fails with ReadErrorKind::InvalidSelection for too many selectors, an out of range
 * index or a step below 1.
 */
[[nodiscard]] std::expected<ResolvedSelection, ReadError> resolve_selection(std::span<const Selector> selection,
                                                                            const Coords& shape);

} // namespace chunkslice
