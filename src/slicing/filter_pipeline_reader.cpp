#include "filter_pipeline_reader.h"

#include "../codecs/blocked_chunk_codec.h"
#include "../data_io/byte_order.h"
#include "../geometry/grid.h"
#include "../geometry/strided_copy.h"

#include <format>
#include <stdexcept>

namespace chunkslice {

std::expected<void, EngineError> read_via_filter_pipeline(IDatasetStore& store, const SliceRequest& request,
                                                          std::span<std::byte> output) {
    const auto& descriptor = store.descriptor();
    const auto output_shape = request.output_shape();
    const auto output_nbytes = static_cast<size_t>(output_shape.product()) * descriptor.element_size;
    if (output.size() != output_nbytes) {
        throw std::invalid_argument(std::format("Output buffer has {} bytes, the request needs {}.", output.size(), output_nbytes));
    }
    if (request.empty()) {
        return {};
    }

    const size_t ndim = descriptor.ndim();
    const auto& region = request.region;
    const auto& step = request.step;
    const ChunkGeometry geometry{descriptor.chunk_shape, descriptor.block_shape, descriptor.element_size};
    const bool swap = needs_byte_swap(descriptor.dtype, descriptor.byte_order);
    BlockedChunkCodec codec;

    for (const auto& chunk_index : geometry::chunks_intersecting(region, descriptor.chunk_shape)) {
        // First selected element inside the chunk and the number of selected elements, per axis.
        Coords first(ndim);
        Coords count(ndim);
        bool selects_anything = true;
        for (size_t i = 0; i < ndim; ++i) {
            const int64_t chunk_start = chunk_index[i] * descriptor.chunk_shape[i];
            const auto overlap = geometry::clip(region.axis(i), Range{chunk_start, chunk_start + descriptor.chunk_shape[i]});
            const int64_t lead = overlap.start - region.start[i];
            const int64_t skip = lead == 0 ? 0 : 1 + (lead - 1) / step[i];
            if (skip > (region.stop[i] - 1 - region.start[i]) / step[i]) {
                // No selected element reaches this chunk on this axis.
                selects_anything = false;
                break;
            }
            first[i] = region.start[i] + skip * step[i];
            count[i] = first[i] < overlap.stop ? 1 + (overlap.stop - first[i] - 1) / step[i] : 0;
            selects_anything = selects_anything && count[i] > 0;
        }
        if (!selects_anything) {
            continue;
        }

        auto raw = store.get_raw_chunk_bytes(chunk_index);
        if (!raw) {
            return std::unexpected(EngineError{raw.error()});
        }
        auto chunk = codec.decode_chunk(*raw, descriptor.codec, geometry);
        if (!chunk) {
            return std::unexpected(EngineError{chunk.error()});
        }
        if (swap) {
            byteswap_elements(*chunk, descriptor.element_size);
        }

        Coords src_offset(ndim);
        Coords dst_offset(ndim);
        for (size_t i = 0; i < ndim; ++i) {
            src_offset[i] = first[i] - chunk_index[i] * descriptor.chunk_shape[i];
            dst_offset[i] = (first[i] - region.start[i]) / step[i];
        }
        geometry::copy_strided(*chunk, geometry::StridedView(descriptor.chunk_shape, src_offset, step),
                               output, geometry::StridedView(output_shape, dst_offset),
                               count, descriptor.element_size);
    }
    return {};
}

} // namespace chunkslice
