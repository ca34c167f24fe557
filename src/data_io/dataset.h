#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

#include "../file_format/dataset_metadata.h"
#include "../memory/allocator.h"
#include "../slicing/region_reader.h"
#include "../slicing/selection.h"
#include "dataset_store.h"
#include "read_errors.h"

namespace chunkslice {

enum class ReadStrategy {
    // Block-level reads where possible, whole-chunk decoding otherwise
    Optimized,
    // Whole-chunk decoding only
    FilterPipeline
};

/// Result of a read: row-major bytes plus the shape left after dropping indexed axes.
struct ArrayBuffer {
    memory::byte_vector data;
    Coords shape;
    DType dtype = DType::UINT8;
    size_t element_size = 0;

    [[nodiscard]] int64_t num_elements() const { return shape.product(); }

    template <typename T>
    [[nodiscard]] std::span<const T> as() const {
        return {reinterpret_cast<const T*>(data.data()), data.size() / sizeof(T)};
    }
};

/**
 * @brief A readable dataset: a store plus the strategy used to serve reads.
 */
class Dataset {
public:
    explicit Dataset(std::shared_ptr<IDatasetStore> store, ReadStrategy strategy = ReadStrategy::Optimized);

    /** @brief Opens a dataset file with a DatasetReader store. */
    static std::expected<Dataset, std::string> open(const std::filesystem::path& filepath,
                                                    ReadStrategy strategy = ReadStrategy::Optimized);

    [[nodiscard]] const DatasetDescriptor& descriptor() const { return store_->descriptor(); }
    [[nodiscard]] ReadStrategy strategy() const { return strategy_; }
    void set_strategy(ReadStrategy strategy);

    /** @brief Reads a selection into a new buffer. */
    std::expected<ArrayBuffer, ReadError> read(std::span<const Selector> selection);
    std::expected<ArrayBuffer, ReadError> read(const Selection& selection) { return read(std::span<const Selector>(selection)); }
    std::expected<ArrayBuffer, ReadError> read_all() { return read(std::span<const Selector>{}); }

    /** @brief Reads a selection into a caller buffer sized for the selection's result. */
    std::expected<void, ReadError> read_into(std::span<const Selector> selection, std::span<std::byte> output);

    /** @brief Statistics of the optimized strategy; null with ReadStrategy::FilterPipeline. */
    [[nodiscard]] const ReadStatistics* statistics() const;

    [[nodiscard]] IRegionReader& region_reader() { return *reader_; }
    [[nodiscard]] const std::shared_ptr<IDatasetStore>& store() const { return store_; }

private:
    std::shared_ptr<IDatasetStore> store_;
    ReadStrategy strategy_;
    std::unique_ptr<IRegionReader> reader_;
};

} // namespace chunkslice
