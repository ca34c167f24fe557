#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <vector>

#include "../data_io/read_errors.h"
#include "../file_format/dataset_metadata.h"
#include "../geometry/coords.h"
#include "slice_request.h"

namespace chunkslice {

/**
 * @brief One partial-block copy: a box of a decompressed block into the output region.
 *
 * Block indices are local to the chunk. The decompressed block is a row-major array of
 * `block_shape` (the block clipped to the chunk's nominal shape).
 */
struct CopyTask {
    Coords chunk_index;
    int64_t chunk_linear = 0;
    Coords block_index;
    int64_t block_linear = 0;
    Coords block_shape;
    Coords source_offset;
    Coords dest_offset;
    Coords extent;

    friend bool operator==(const CopyTask&, const CopyTask&) = default;
};

struct SlicePlan {
    Region region;
    Coords output_shape;
    size_t element_size = 0;
    Coords chunk_shape;
    Coords block_shape;
    // Ascending chunk order, then ascending block order inside each chunk
    std::vector<CopyTask> tasks;

    [[nodiscard]] size_t output_nbytes() const { return static_cast<size_t>(output_shape.product()) * element_size; }
};

/**
 * @brief Plans the block-level read of a unit-step request.
 *
 * Declines with NotApplicable for non-unit steps, a non-native byte order, a codec without
 * block access, invalid block geometry, or multi-dimensional chunks whose frames do not
 * record their block shape. Pure: the same input always gives the same plan.
 */
[[nodiscard]] std::expected<SlicePlan, NotApplicable> plan(const DatasetDescriptor& descriptor, const SliceRequest& request);

} // namespace chunkslice
