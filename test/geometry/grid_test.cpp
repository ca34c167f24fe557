#include <gtest/gtest.h>
#include <vector>

#include "../../src/geometry/grid.h"

using namespace chunkslice;
using namespace chunkslice::geometry;

namespace {

std::vector<Coords> collect(const GridRange& range) {
    std::vector<Coords> out;
    for (const auto& c : range) {
        out.push_back(c);
    }
    return out;
}

} // namespace

TEST(GridTest, ChunkGridRoundsUp) {
    EXPECT_EQ(chunk_grid(Coords{100}, Coords{40}), (Coords{3}));
    EXPECT_EQ(chunk_grid(Coords{10, 9}, Coords{5, 3}), (Coords{2, 3}));
    EXPECT_EQ(chunk_grid(Coords{0, 4}, Coords{5, 3}), (Coords{0, 2}));
}

TEST(GridTest, BlockGridRoundsUp) {
    EXPECT_EQ(block_grid(Coords{40}, Coords{10}), (Coords{4}));
    EXPECT_EQ(block_grid(Coords{7, 8}, Coords{3, 8}), (Coords{3, 1}));
}

TEST(GridTest, ClipRanges) {
    EXPECT_EQ(clip(Range{0, 10}, Range{5, 15}), (Range{5, 10}));
    EXPECT_EQ(clip(Range{5, 15}, Range{0, 10}), (Range{5, 10}));
    EXPECT_TRUE(clip(Range{0, 5}, Range{5, 10}).empty());
    EXPECT_TRUE(clip(Range{0, 3}, Range{7, 10}).empty());
    EXPECT_EQ(clip(Range{2, 4}, Range{0, 10}), (Range{2, 4}));
}

TEST(GridTest, ClipRegions) {
    const Region a(Coords{0, 0}, Coords{10, 10});
    const Region b(Coords{5, -2}, Coords{20, 3});
    EXPECT_EQ(clip(a, b), Region(Coords{5, 0}, Coords{10, 3}));
    EXPECT_TRUE(clip(a, Region(Coords{10, 0}, Coords{12, 5})).empty());
}

TEST(GridTest, LinearIndexAndUnravelAreInverse) {
    const Coords grid{3, 4, 5};
    int64_t expected = 0;
    for (const auto& index : GridRange(Coords{0, 0, 0}, grid)) {
        EXPECT_EQ(linear_index(index, grid), expected);
        EXPECT_EQ(unravel_index(expected, grid), index);
        ++expected;
    }
    EXPECT_EQ(expected, grid.product());
}

TEST(GridTest, RowMajorStrides) {
    EXPECT_EQ(row_major_strides(Coords{3, 4, 5}), (Coords{20, 5, 1}));
    EXPECT_EQ(row_major_strides(Coords{7}), (Coords{1}));
}

TEST(GridTest, ChunkExtentIsClippedAtTheEdge) {
    EXPECT_EQ(chunk_extent(Coords{2}, Coords{40}, Coords{100}), Region(Coords{80}, Coords{100}));
    EXPECT_EQ(chunk_extent(Coords{1, 0}, Coords{5, 5}, Coords{8, 12}), Region(Coords{5, 0}, Coords{8, 5}));
}

TEST(GridTest, BlockExtentIsClippedToTheChunk) {
    EXPECT_EQ(block_extent(Coords{2}, Coords{3}, Coords{7}), Region(Coords{6}, Coords{7}));
    EXPECT_EQ(block_extent(Coords{0, 1}, Coords{4, 4}, Coords{4, 6}), Region(Coords{0, 4}, Coords{4, 6}));
}

TEST(GridRangeTest, EnumeratesRowMajorOuterAxisSlowest) {
    const auto cells = collect(GridRange(Coords{1, 0}, Coords{3, 2}));
    const std::vector<Coords> expected{Coords{1, 0}, Coords{1, 1}, Coords{2, 0}, Coords{2, 1}};
    EXPECT_EQ(cells, expected);
}

TEST(GridRangeTest, IsRestartable) {
    const GridRange range(Coords{0, 0}, Coords{2, 3});
    EXPECT_EQ(collect(range), collect(range));
    EXPECT_EQ(range.count(), 6);
}

TEST(GridRangeTest, EmptyAxisYieldsNothing) {
    const GridRange range(Coords{0, 2}, Coords{3, 2});
    EXPECT_TRUE(range.empty());
    EXPECT_EQ(range.count(), 0);
    EXPECT_TRUE(collect(range).empty());
}

TEST(GridRangeTest, ChunksIntersecting) {
    const Region region(Coords{35}, Coords{45});
    const auto chunks = collect(chunks_intersecting(region, Coords{40}));
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], (Coords{0}));
    EXPECT_EQ(chunks[1], (Coords{1}));

    const Region inside(Coords{41}, Coords{79});
    EXPECT_EQ(chunks_intersecting(inside, Coords{40}).count(), 1);
    EXPECT_TRUE(chunks_intersecting(Region(Coords{10}, Coords{10}), Coords{40}).empty());
}

TEST(GridRangeTest, BlocksIntersectingIsLocalToTheChunk) {
    const Region region(Coords{35}, Coords{45});
    const auto in_first = collect(blocks_intersecting(region, Coords{0}, Coords{40}, Coords{10}));
    ASSERT_EQ(in_first.size(), 1u);
    EXPECT_EQ(in_first[0], (Coords{3}));

    const auto in_second = collect(blocks_intersecting(region, Coords{1}, Coords{40}, Coords{10}));
    ASSERT_EQ(in_second.size(), 1u);
    EXPECT_EQ(in_second[0], (Coords{0}));

    // A chunk the region does not touch has no blocks
    EXPECT_TRUE(blocks_intersecting(region, Coords{2}, Coords{40}, Coords{10}).empty());
}

TEST(GridRangeTest, BlocksIntersecting2D) {
    const Region region(Coords{3, 1}, Coords{9, 7});
    const auto blocks = blocks_intersecting(region, Coords{0, 0}, Coords{8, 8}, Coords{4, 4});
    EXPECT_EQ(blocks.lo(), (Coords{0, 0}));
    EXPECT_EQ(blocks.hi(), (Coords{2, 2}));
    const auto edge = blocks_intersecting(region, Coords{1, 0}, Coords{8, 8}, Coords{4, 4});
    EXPECT_EQ(edge.lo(), (Coords{0, 0}));
    EXPECT_EQ(edge.hi(), (Coords{1, 2}));
}

TEST(CoordsTest, RejectsTooManyDimensions) {
    EXPECT_THROW(Coords(MAX_DIMENSIONS + 1), std::length_error);
    EXPECT_NO_THROW(Coords(MAX_DIMENSIONS));
}

TEST(CoordsTest, ProductAndFormatting) {
    EXPECT_EQ((Coords{2, 3, 4}).product(), 24);
    EXPECT_EQ(Coords().product(), 1);
    EXPECT_EQ((Coords{1, 2}).to_string(), "(1, 2)");
    EXPECT_EQ(Region(Coords{0, 1}, Coords{2, 3}).to_string(), "[0:2, 1:3]");
}
