#include "grid.h"

#include <algorithm>
#include <stdexcept>

namespace chunkslice::geometry {

namespace {

// `b` is positive. Division truncates toward zero, which is already the ceiling for negative `a`.
int64_t ceil_div(const int64_t a, const int64_t b) {
    return a / b + (a % b > 0 ? 1 : 0);
}

int64_t floor_div(const int64_t a, const int64_t b) {
    return a / b;
}

void require_same_ndim(const Coords& a, const Coords& b, const char* what) {
    if (a.size() != b.size()) {
        throw std::invalid_argument(std::format("{}: dimensionality mismatch ({} vs {}).", what, a.size(), b.size()));
    }
}

// Grid cells of size `cell` overlapping `region`, which lives in the same coordinates as the grid origin.
GridRange cells_overlapping(const Region& region, const Coords& cell) {
    const size_t ndim = region.ndim();
    Coords lo(ndim);
    Coords hi(ndim);
    for (size_t i = 0; i < ndim; ++i) {
        const auto r = region.axis(i);
        if (r.empty()) {
            return {Coords(ndim, 0), Coords(ndim, 0)};
        }
        lo[i] = floor_div(r.start, cell[i]);
        hi[i] = ceil_div(r.stop, cell[i]);
    }
    return {lo, hi};
}

} // namespace

Coords chunk_grid(const Coords& shape, const Coords& chunk_shape) {
    require_same_ndim(shape, chunk_shape, "chunk_grid");
    Coords grid(shape.size());
    for (size_t i = 0; i < shape.size(); ++i) {
        grid[i] = ceil_div(shape[i], chunk_shape[i]);
    }
    return grid;
}

Coords block_grid(const Coords& chunk_shape, const Coords& block_shape) {
    require_same_ndim(chunk_shape, block_shape, "block_grid");
    Coords grid(chunk_shape.size());
    for (size_t i = 0; i < chunk_shape.size(); ++i) {
        grid[i] = ceil_div(chunk_shape[i], block_shape[i]);
    }
    return grid;
}

Range clip(const Range a, const Range b) {
    const int64_t start = std::max(a.start, b.start);
    const int64_t stop = std::min(a.stop, b.stop);
    if (stop <= start) {
        return {start, start};
    }
    return {start, stop};
}

Region clip(const Region& a, const Region& b) {
    require_same_ndim(a.start, b.start, "clip");
    Region res(Coords(a.ndim()), Coords(a.ndim()));
    for (size_t i = 0; i < a.ndim(); ++i) {
        const auto r = clip(a.axis(i), b.axis(i));
        res.start[i] = r.start;
        res.stop[i] = r.stop;
    }
    return res;
}

Coords row_major_strides(const Coords& shape) {
    Coords strides(shape.size(), 1);
    for (size_t i = shape.size(); i-- > 1;) {
        strides[i - 1] = strides[i] * shape[i];
    }
    return strides;
}

int64_t linear_index(const Coords& index, const Coords& grid) {
    require_same_ndim(index, grid, "linear_index");
    int64_t res = 0;
    for (size_t i = 0; i < index.size(); ++i) {
        res = res * grid[i] + index[i];
    }
    return res;
}

Coords unravel_index(int64_t linear, const Coords& grid) {
    Coords res(grid.size());
    for (size_t i = grid.size(); i-- > 0;) {
        res[i] = linear % grid[i];
        linear /= grid[i];
    }
    return res;
}

Region chunk_extent(const Coords& chunk_index, const Coords& chunk_shape, const Coords& shape) {
    const size_t ndim = chunk_index.size();
    Region res(Coords(ndim), Coords(ndim));
    for (size_t i = 0; i < ndim; ++i) {
        const Range nominal{chunk_index[i] * chunk_shape[i], (chunk_index[i] + 1) * chunk_shape[i]};
        const auto actual = clip(nominal, Range{0, shape[i]});
        res.start[i] = actual.start;
        res.stop[i] = actual.stop;
    }
    return res;
}

Region block_extent(const Coords& block_index, const Coords& block_shape, const Coords& chunk_shape) {
    return chunk_extent(block_index, block_shape, chunk_shape);
}

// --- GridRange ---

GridRange::GridRange(Coords lo, Coords hi) : lo_(lo), hi_(hi) {
    require_same_ndim(lo_, hi_, "GridRange");
}

bool GridRange::empty() const {
    if (lo_.empty()) {
        return true;
    }
    for (size_t i = 0; i < lo_.size(); ++i) {
        if (hi_[i] <= lo_[i]) {
            return true;
        }
    }
    return false;
}

int64_t GridRange::count() const {
    if (empty()) {
        return 0;
    }
    int64_t res = 1;
    for (size_t i = 0; i < lo_.size(); ++i) {
        res *= hi_[i] - lo_[i];
    }
    return res;
}

GridRange::iterator::iterator(const GridRange* range, const bool done)
    : range_(range), current_(range->lo_), done_(done) {}

GridRange::iterator& GridRange::iterator::operator++() {
    if (done_) {
        return *this;
    }
    for (size_t i = current_.size(); i-- > 0;) {
        if (++current_[i] < range_->hi_[i]) {
            return *this;
        }
        current_[i] = range_->lo_[i];
    }
    done_ = true;
    return *this;
}

GridRange chunks_intersecting(const Region& region, const Coords& chunk_shape) {
    require_same_ndim(region.start, chunk_shape, "chunks_intersecting");
    return cells_overlapping(region, chunk_shape);
}

GridRange blocks_intersecting(const Region& region, const Coords& chunk_index,
                              const Coords& chunk_shape, const Coords& block_shape) {
    require_same_ndim(region.start, chunk_index, "blocks_intersecting");
    require_same_ndim(chunk_shape, block_shape, "blocks_intersecting");
    const size_t ndim = region.ndim();

    // The part of the region inside this chunk, translated to chunk-local coordinates.
    Region local(Coords(ndim), Coords(ndim));
    for (size_t i = 0; i < ndim; ++i) {
        const int64_t origin = chunk_index[i] * chunk_shape[i];
        const auto overlap = clip(region.axis(i), Range{origin, origin + chunk_shape[i]});
        local.start[i] = overlap.start - origin;
        local.stop[i] = overlap.stop - origin;
    }
    return cells_overlapping(local, block_shape);
}

} // namespace chunkslice::geometry
