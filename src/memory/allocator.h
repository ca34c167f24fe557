#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// Conditionally include mimalloc headers if USE_MIMALLOC is defined by CMake.
#ifdef USE_MIMALLOC
#include <mimalloc.h>
#endif

namespace chunkslice::memory
{

#ifdef USE_MIMALLOC
    // Decompressed blocks and chunks are short-lived and churn a lot,
    // mimalloc's thread-local heaps serve them well.
    template<typename T>
    using vector = std::vector<T, ::mi_stl_allocator<T>>;
#else
    template<typename T>
    using vector = std::vector<T>;
#endif

    using byte_vector = vector<std::byte>;

    /**
     * @brief Resizes a scratch buffer to exactly @p size bytes and returns a view of it.
     *
     * The capacity is kept across calls, so a buffer reused for blocks of the same
     * dataset stops allocating after the first call.
     */
    inline std::span<std::byte> reuse_scratch(byte_vector& scratch, const size_t size)
    {
        if (scratch.size() != size)
        {
            scratch.resize(size);
        }
        return {scratch.data(), size};
    }

} // namespace chunkslice::memory
