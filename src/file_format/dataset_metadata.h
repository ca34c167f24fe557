#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

#include "../geometry/coords.h"
#include "../memory/allocator.h"
#include "dataset_format.h"

namespace chunkslice {

/**
 * @brief Read-only description of a chunked dataset.
 *
 * Every chunk is stored at its nominal `chunk_shape` (edge chunks zero padded) and split
 * into blocks of `block_shape`. `block_shape_recorded` tells whether chunk frames carry
 * their chunk and block shapes in the frame header.
 */
struct DatasetDescriptor {
    Coords shape;
    Coords chunk_shape;
    Coords block_shape;
    size_t element_size = 0;
    DType dtype = DType::UINT8;
    ByteOrder byte_order = native_byte_order();
    ChunkCodec codec = ChunkCodec::BLOCKED_ZSTD;
    bool block_shape_recorded = true;

    [[nodiscard]] size_t ndim() const { return shape.size(); }
    /** @brief Chunks per axis. */
    [[nodiscard]] Coords chunks() const;
    [[nodiscard]] int64_t num_chunks() const { return chunks().product(); }
    /** @brief Decoded size of one (padded) chunk. */
    [[nodiscard]] size_t chunk_nbytes() const { return static_cast<size_t>(chunk_shape.product()) * element_size; }

    /**
     * @brief Checks dimensionality, positive extents, `1 <= block_shape <= chunk_shape` and the
     * element size, and that chunk counts and byte sizes fit in int64_t.
     */
    [[nodiscard]] std::expected<void, std::string> validate() const;

    friend bool operator==(const DatasetDescriptor&, const DatasetDescriptor&) = default;
};

/** @brief Encodes the descriptor as the JSON document stored in the file header. */
[[nodiscard]] memory::byte_vector serialize_descriptor(const DatasetDescriptor& descriptor);

/** @brief Parses and validates a descriptor previously written by serialize_descriptor(). */
[[nodiscard]] std::expected<DatasetDescriptor, std::string> parse_descriptor(std::span<const std::byte> bytes);

} // namespace chunkslice
