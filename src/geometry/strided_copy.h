#pragma once

#include <cstddef>
#include <span>

#include "coords.h"

namespace chunkslice::geometry {

/**
 * @brief Describes one side of a strided copy: a row-major array and the box being read or written.
 *
 * `step` is the element step used on that side (1 everywhere except for stepped fallback reads).
 */
struct StridedView {
    Coords shape;
    Coords offset;
    Coords step;

    StridedView(Coords shape_, Coords offset_) : shape(shape_), offset(offset_), step(Coords(shape_.size(), 1)) {}
    StridedView(Coords shape_, Coords offset_, Coords step_) : shape(shape_), offset(offset_), step(step_) {}
};

/**
 * @brief Copies `extent` elements per axis from `src` to `dst`, elements being opaque runs of `element_size` bytes.
 *
 * Both buffers hold row-major arrays of their view's shape. Bit patterns are preserved.
 * Runs that are contiguous on both sides along the innermost axes are copied with a single memcpy.
 *
 * @throws std::out_of_range if a view would be accessed outside its shape or buffer.
 */
void copy_strided(std::span<const std::byte> src, const StridedView& src_view,
                  std::span<std::byte> dst, const StridedView& dst_view,
                  const Coords& extent, size_t element_size);

} // namespace chunkslice::geometry
