#pragma once

#include <cstdint>
#include <expected>
#include <optional>

#include "../file_format/dataset_metadata.h"
#include "../geometry/coords.h"
#include "../memory/allocator.h"
#include "read_errors.h"

namespace chunkslice {

/// Where a chunk payload lives, and the block shape its frame header records (if any).
struct ChunkLayout {
    uint64_t byte_offset = 0;
    uint64_t byte_length = 0;
    std::optional<Coords> recorded_block_shape;
};

/**
 * @brief Owner of chunk metadata and raw chunk bytes, consumed by the read paths.
 *
 * Chunk indices are multi-indices into the chunk grid. Implementations must be safe to
 * call from several threads at once.
 */
class IDatasetStore {
public:
    virtual ~IDatasetStore() = default;

    [[nodiscard]] virtual const DatasetDescriptor& descriptor() const = 0;

    virtual std::expected<ChunkLayout, StoreError> get_chunk_layout(const Coords& chunk_index) = 0;

    /** @return The encoded chunk payload, integrity checked. */
    virtual std::expected<memory::byte_vector, StoreError> get_raw_chunk_bytes(const Coords& chunk_index) = 0;
};

} // namespace chunkslice
