#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>

#include "coords.h"

namespace chunkslice::geometry {

/** @brief Number of chunks per axis, `ceil(shape_i / chunk_shape_i)`. */
[[nodiscard]] Coords chunk_grid(const Coords& shape, const Coords& chunk_shape);

/** @brief Number of blocks per axis inside one chunk, `ceil(chunk_shape_i / block_shape_i)`. */
[[nodiscard]] Coords block_grid(const Coords& chunk_shape, const Coords& block_shape);

/** @brief Intersection of two half-open ranges; an empty range (start == stop) when disjoint. */
[[nodiscard]] Range clip(Range a, Range b);

/** @brief Axis-wise intersection of two regions. */
[[nodiscard]] Region clip(const Region& a, const Region& b);

/** @brief Row-major element strides of an array of the given shape. */
[[nodiscard]] Coords row_major_strides(const Coords& shape);

/** @brief Row-major linear position of `index` inside a grid of shape `grid`. */
[[nodiscard]] int64_t linear_index(const Coords& index, const Coords& grid);

/** @brief Inverse of linear_index(): the multi-index at row-major position `linear` of `grid`. */
[[nodiscard]] Coords unravel_index(int64_t linear, const Coords& grid);

/** @brief Extent of a chunk in dataset coordinates, clipped to the dataset shape. */
[[nodiscard]] Region chunk_extent(const Coords& chunk_index, const Coords& chunk_shape, const Coords& shape);

/** @brief Extent of a block in chunk-local coordinates, clipped to the chunk's nominal shape. */
[[nodiscard]] Region block_extent(const Coords& block_index, const Coords& block_shape, const Coords& chunk_shape);

/**
 * @brief A box of grid indices [lo, hi) enumerated in row-major order.
 *
 * The outermost axis varies slowest. The sequence is lazy and can be iterated
 * any number of times. A box with any empty axis yields nothing.
 */
class GridRange {
    Coords lo_;
    Coords hi_;

public:
    class iterator {
        const GridRange* range_ = nullptr;
        Coords current_;
        bool done_ = true;

    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Coords;
        using difference_type = std::ptrdiff_t;
        using pointer = const Coords*;
        using reference = const Coords&;

        iterator() = default;
        iterator(const GridRange* range, bool done);

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++();
        iterator operator++(int) {
            auto tmp = *this;
            ++*this;
            return tmp;
        }

        friend bool operator==(const iterator& a, const iterator& b) {
            if (a.done_ || b.done_) {
                return a.done_ == b.done_;
            }
            return a.current_ == b.current_;
        }
    };

    GridRange() = default;
    GridRange(Coords lo, Coords hi);

    [[nodiscard]] const Coords& lo() const { return lo_; }
    [[nodiscard]] const Coords& hi() const { return hi_; }

    [[nodiscard]] bool empty() const;
    [[nodiscard]] int64_t count() const;

    [[nodiscard]] iterator begin() const { return {this, empty()}; }
    [[nodiscard]] iterator end() const { return {this, true}; }
};

/** @brief Chunk indices whose nominal extent overlaps `region`. */
[[nodiscard]] GridRange chunks_intersecting(const Region& region, const Coords& chunk_shape);

/**
 * @brief Block indices (inside chunk `chunk_index`) overlapping the part of `region` in that chunk.
 *
 * `region` is in dataset coordinates.
 */
[[nodiscard]] GridRange blocks_intersecting(const Region& region, const Coords& chunk_index,
                                            const Coords& chunk_shape, const Coords& block_shape);

} // namespace chunkslice::geometry
