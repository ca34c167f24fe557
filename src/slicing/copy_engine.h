#pragma once

#include <expected>
#include <span>

#include "../data_io/dataset_store.h"
#include "../data_io/read_errors.h"
#include "block_decompressor.h"
#include "slice_planner.h"

namespace chunkslice {

/**
 * @brief Runs a plan: fetches each needed chunk once, decompresses the planned blocks and
 * copies their overlap into `output`.
 *
 * `output` is the row-major array of `plan.output_shape`. Stops at the first error; the
 * output is then partially written.
 *
 * @throws std::invalid_argument if `output` does not have `plan.output_nbytes()` bytes.
 */
std::expected<void, EngineError> execute(const SlicePlan& plan, IDatasetStore& store, BlockDecompressor& adapter,
                                         std::span<std::byte> output);

} // namespace chunkslice
