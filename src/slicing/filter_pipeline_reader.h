#pragma once

#include <expected>
#include <span>

#include "../data_io/dataset_store.h"
#include "../data_io/read_errors.h"
#include "slice_request.h"

namespace chunkslice {

/**
 * @brief Reads a request by decoding every intersecting chunk completely.
 *
 * Works for any codec and any positive step, and converts elements of numeric dtypes
 * stored in the non-native byte order. `output` is the row-major array of
 * `request.output_shape()`.
 *
 * @throws std::invalid_argument if `output` has the wrong size for the request.
 */
std::expected<void, EngineError> read_via_filter_pipeline(IDatasetStore& store, const SliceRequest& request,
                                                          std::span<std::byte> output);

} // namespace chunkslice
