#include "copy_engine.h"

#include "../geometry/strided_copy.h"

#include <format>
#include <optional>
#include <stdexcept>

namespace chunkslice {

std::expected<void, EngineError> execute(const SlicePlan& plan, IDatasetStore& store, BlockDecompressor& adapter,
                                         std::span<std::byte> output) {
    if (output.size() != plan.output_nbytes()) {
        throw std::invalid_argument(std::format("Output buffer has {} bytes, the plan writes {}.", output.size(), plan.output_nbytes()));
    }

    std::optional<int64_t> current_chunk;
    memory::byte_vector raw;
    BlockFrameInfo frame;

    for (const auto& task : plan.tasks) {
        // Tasks of one chunk are consecutive: fetch its bytes once per run.
        if (current_chunk != task.chunk_linear) {
            auto layout_res = store.get_chunk_layout(task.chunk_index);
            if (!layout_res) {
                return std::unexpected(EngineError{layout_res.error()});
            }
            auto raw_res = store.get_raw_chunk_bytes(task.chunk_index);
            if (!raw_res) {
                return std::unexpected(EngineError{raw_res.error()});
            }
            raw = std::move(*raw_res);
            auto frame_res = adapter.validate_chunk(raw, *layout_res);
            if (!frame_res) {
                return std::unexpected(EngineError{frame_res.error()});
            }
            frame = std::move(*frame_res);
            current_chunk = task.chunk_linear;
        }

        auto block = adapter.decompress_block(raw, frame, task.block_index);
        if (!block) {
            return std::unexpected(EngineError{block.error()});
        }

        geometry::copy_strided(*block, geometry::StridedView(task.block_shape, task.source_offset),
                               output, geometry::StridedView(plan.output_shape, task.dest_offset),
                               task.extent, plan.element_size);
    }
    return {};
}

} // namespace chunkslice
