#include "slice_planner.h"

#include "../geometry/grid.h"

#include <format>
#include <magic_enum/magic_enum.hpp>

namespace chunkslice {

namespace {

std::expected<void, NotApplicable> check_geometry(const DatasetDescriptor& d, const SliceRequest& request) {
    const size_t ndim = d.ndim();
    if (ndim == 0 || d.chunk_shape.size() != ndim || d.block_shape.size() != ndim || request.ndim() != ndim) {
        return std::unexpected(NotApplicable(NotApplicableReason::InvalidGeometry, "dimensionality mismatch"));
    }
    if (d.element_size == 0) {
        return std::unexpected(NotApplicable(NotApplicableReason::InvalidGeometry, "zero element size"));
    }
    for (size_t i = 0; i < ndim; ++i) {
        if (d.chunk_shape[i] < 1 || d.block_shape[i] < 1 || d.block_shape[i] > d.chunk_shape[i]) {
            return std::unexpected(NotApplicable(NotApplicableReason::InvalidGeometry,
                                                 std::format("block shape {} vs chunk shape {}", d.block_shape, d.chunk_shape)));
        }
        const auto r = request.region.axis(i);
        if (r.start < 0 || r.stop > d.shape[i] || r.stop < r.start) {
            return std::unexpected(NotApplicable(NotApplicableReason::InvalidGeometry,
                                                 std::format("region {} outside shape {}", request.region, d.shape)));
        }
    }
    return {};
}

} // namespace

std::expected<SlicePlan, NotApplicable> plan(const DatasetDescriptor& descriptor, const SliceRequest& request) {
    if (!request.unit_step()) {
        return std::unexpected(NotApplicable(NotApplicableReason::NonUnitStep, std::format("step {}", request.step)));
    }
    if (descriptor.byte_order != native_byte_order()) {
        return std::unexpected(NotApplicable(NotApplicableReason::ByteOrderMismatch,
                                             std::format("stored {}", magic_enum::enum_name(descriptor.byte_order))));
    }
    if (!codec_supports_block_access(descriptor.codec)) {
        return std::unexpected(NotApplicable(NotApplicableReason::UnsupportedCodec,
                                             std::string(magic_enum::enum_name(descriptor.codec))));
    }
    if (auto res = check_geometry(descriptor, request); !res) {
        return std::unexpected(res.error());
    }
    // 1-D frames without dimensions still give their block length through their byte sizes.
    if (!descriptor.block_shape_recorded && descriptor.ndim() > 1) {
        return std::unexpected(NotApplicable(NotApplicableReason::MissingBlockMetadata,
                                             std::format("{}-dimensional chunks without recorded block shape", descriptor.ndim())));
    }

    const size_t ndim = descriptor.ndim();
    const auto& chunk_shape = descriptor.chunk_shape;
    const auto& block_shape = descriptor.block_shape;
    const auto& region = request.region;

    SlicePlan result;
    result.region = region;
    result.output_shape = region.extent();
    result.element_size = descriptor.element_size;
    result.chunk_shape = chunk_shape;
    result.block_shape = block_shape;
    if (region.empty()) {
        return result;
    }

    const auto chunk_grid = geometry::chunk_grid(descriptor.shape, chunk_shape);
    const auto block_grid = geometry::block_grid(chunk_shape, block_shape);

    for (const auto& chunk_index : geometry::chunks_intersecting(region, chunk_shape)) {
        Coords chunk_origin(ndim);
        for (size_t i = 0; i < ndim; ++i) {
            chunk_origin[i] = chunk_index[i] * chunk_shape[i];
        }
        const auto chunk_linear = geometry::linear_index(chunk_index, chunk_grid);

        for (const auto& block_index : geometry::blocks_intersecting(region, chunk_index, chunk_shape, block_shape)) {
            const auto local = geometry::block_extent(block_index, block_shape, chunk_shape);

            CopyTask task;
            task.chunk_index = chunk_index;
            task.chunk_linear = chunk_linear;
            task.block_index = block_index;
            task.block_linear = geometry::linear_index(block_index, block_grid);
            task.block_shape = local.extent();
            task.source_offset = Coords(ndim);
            task.dest_offset = Coords(ndim);
            task.extent = Coords(ndim);

            for (size_t i = 0; i < ndim; ++i) {
                const int64_t block_start = chunk_origin[i] + local.start[i];
                const auto overlap = geometry::clip(Range{block_start, chunk_origin[i] + local.stop[i]}, region.axis(i));
                task.source_offset[i] = overlap.start - block_start;
                task.dest_offset[i] = overlap.start - region.start[i];
                task.extent[i] = overlap.size();
            }
            result.tasks.push_back(task);
        }
    }
    return result;
}

} // namespace chunkslice
