#pragma once

#include <cstddef>

#include "../geometry/coords.h"

namespace chunkslice {

/**
 * @brief A hyperslab: per axis the elements start, start + step, ... below stop.
 *
 * `region` holds the bounds in dataset coordinates. The result is a dense row-major
 * array of output_shape().
 */
struct SliceRequest {
    Region region;
    Coords step;

    SliceRequest() = default;
    SliceRequest(Region region_, Coords step_) : region(region_), step(step_) {}

    /** @brief A unit-step request covering `region`. */
    static SliceRequest contiguous(const Region& region) { return {region, Coords(region.ndim(), 1)}; }

    [[nodiscard]] size_t ndim() const { return region.ndim(); }

    [[nodiscard]] bool unit_step() const {
        for (const auto s : step) {
            if (s != 1) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] Coords output_shape() const {
        Coords shape(region.ndim());
        for (size_t i = 0; i < region.ndim(); ++i) {
            const auto n = region.axis(i).size();
            shape[i] = step[i] > 0 && n > 0 ? 1 + (n - 1) / step[i] : 0;
        }
        return shape;
    }

    [[nodiscard]] int64_t num_elements() const { return output_shape().product(); }
    [[nodiscard]] bool empty() const { return num_elements() == 0; }
};

} // namespace chunkslice
