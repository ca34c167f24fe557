#include "strided_copy.h"
#include "grid.h"

#include <cstring>
#include <format>
#include <stdexcept>

namespace chunkslice::geometry {

namespace {

void check_view(const StridedView& view, const Coords& extent, const size_t buffer_size, const size_t element_size,
                const char* side) {
    if (view.shape.size() != extent.size() || view.offset.size() != extent.size() || view.step.size() != extent.size()) {
        throw std::out_of_range(std::format("{} view dimensionality does not match the copy extent.", side));
    }
    for (size_t i = 0; i < extent.size(); ++i) {
        if (extent[i] == 0) {
            continue;
        }
        const int64_t last = view.offset[i] + (extent[i] - 1) * view.step[i];
        if (view.offset[i] < 0 || last >= view.shape[i]) {
            throw std::out_of_range(std::format("{} view {} of shape {} cannot hold extent {} on axis {}.",
                                                side, view.offset.to_string(), view.shape.to_string(),
                                                extent.to_string(), i));
        }
    }
    if (static_cast<size_t>(view.shape.product()) * element_size > buffer_size) {
        throw std::out_of_range(std::format("{} buffer of {} bytes is smaller than its shape {}.", side,
                                            buffer_size, view.shape.to_string()));
    }
}

// Byte strides of every axis, honoring the per-axis element step.
Coords byte_strides(const StridedView& view, const size_t element_size) {
    auto strides = row_major_strides(view.shape);
    for (size_t i = 0; i < strides.size(); ++i) {
        strides[i] *= view.step[i] * static_cast<int64_t>(element_size);
    }
    return strides;
}

int64_t byte_offset(const StridedView& view, const size_t element_size) {
    const auto strides = row_major_strides(view.shape);
    int64_t res = 0;
    for (size_t i = 0; i < strides.size(); ++i) {
        res += view.offset[i] * strides[i];
    }
    return res * static_cast<int64_t>(element_size);
}

} // namespace

void copy_strided(std::span<const std::byte> src, const StridedView& src_view,
                  std::span<std::byte> dst, const StridedView& dst_view,
                  const Coords& extent, const size_t element_size) {
    check_view(src_view, extent, src.size(), element_size, "Source");
    check_view(dst_view, extent, dst.size(), element_size, "Destination");

    const size_t ndim = extent.size();
    if (ndim == 0 || Region::whole(extent).empty()) {
        return;
    }

    const auto src_strides = byte_strides(src_view, element_size);
    const auto dst_strides = byte_strides(dst_view, element_size);

    // Fold the innermost axes into one contiguous run while both sides stay dense.
    size_t run_axes = 0;
    auto run_bytes = static_cast<int64_t>(element_size);
    for (size_t i = ndim; i-- > 0;) {
        if (src_strides[i] != run_bytes || dst_strides[i] != run_bytes) {
            break;
        }
        run_bytes *= extent[i];
        ++run_axes;
        // Only a full inner axis keeps the next outer axis contiguous.
        if (extent[i] != src_view.shape[i] || extent[i] != dst_view.shape[i]) {
            break;
        }
    }
    if (run_axes == 0) {
        // Innermost axis is strided: fall back to one element per copy.
        const size_t outer = ndim - 1;
        Coords counter(ndim, 0);
        const std::byte* src_base = src.data() + byte_offset(src_view, element_size);
        std::byte* dst_base = dst.data() + byte_offset(dst_view, element_size);
        while (true) {
            int64_t src_pos = 0;
            int64_t dst_pos = 0;
            for (size_t i = 0; i < outer; ++i) {
                src_pos += counter[i] * src_strides[i];
                dst_pos += counter[i] * dst_strides[i];
            }
            for (int64_t k = 0; k < extent[outer]; ++k) {
                std::memcpy(dst_base + dst_pos + k * dst_strides[outer], src_base + src_pos + k * src_strides[outer],
                            element_size);
            }
            size_t axis = outer;
            while (axis-- > 0) {
                if (++counter[axis] < extent[axis]) {
                    break;
                }
                counter[axis] = 0;
            }
            if (axis == static_cast<size_t>(-1)) {
                return;
            }
        }
    }

    // Iterate the remaining outer axes; each step copies one contiguous run.
    const size_t outer_axes = ndim - run_axes;
    const std::byte* src_base = src.data() + byte_offset(src_view, element_size);
    std::byte* dst_base = dst.data() + byte_offset(dst_view, element_size);
    Coords counter(ndim, 0);
    while (true) {
        int64_t src_pos = 0;
        int64_t dst_pos = 0;
        for (size_t i = 0; i < outer_axes; ++i) {
            src_pos += counter[i] * src_strides[i];
            dst_pos += counter[i] * dst_strides[i];
        }
        std::memcpy(dst_base + dst_pos, src_base + src_pos, static_cast<size_t>(run_bytes));

        size_t axis = outer_axes;
        while (axis-- > 0) {
            if (++counter[axis] < extent[axis]) {
                break;
            }
            counter[axis] = 0;
        }
        if (axis == static_cast<size_t>(-1)) {
            return;
        }
    }
}

} // namespace chunkslice::geometry
