#include "dataset.h"

#include "dataset_reader.h"

#include <stdexcept>

namespace chunkslice {

namespace {

std::unique_ptr<IRegionReader> make_reader(const std::shared_ptr<IDatasetStore>& store, const ReadStrategy strategy) {
    switch (strategy) {
        case ReadStrategy::FilterPipeline: return std::make_unique<FilterPipelineRegionReader>(store);
        case ReadStrategy::Optimized: return std::make_unique<OptimizedRegionReader>(store);
    }
    throw std::invalid_argument("Unknown read strategy.");
}

} // namespace

Dataset::Dataset(std::shared_ptr<IDatasetStore> store, const ReadStrategy strategy)
    : store_(std::move(store)), strategy_(strategy) {
    if (!store_) {
        throw std::invalid_argument("Dataset needs a store.");
    }
    reader_ = make_reader(store_, strategy_);
}

std::expected<Dataset, std::string> Dataset::open(const std::filesystem::path& filepath, const ReadStrategy strategy) {
    auto reader = DatasetReader::open(filepath);
    if (!reader) {
        return std::unexpected(reader.error());
    }
    return Dataset(std::shared_ptr<IDatasetStore>(std::move(*reader)), strategy);
}

void Dataset::set_strategy(const ReadStrategy strategy) {
    if (strategy != strategy_) {
        reader_ = make_reader(store_, strategy);
        strategy_ = strategy;
    }
}

std::expected<ArrayBuffer, ReadError> Dataset::read(std::span<const Selector> selection) {
    const auto& d = descriptor();
    auto resolved = resolve_selection(selection, d.shape);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }

    ArrayBuffer result;
    result.shape = resolved->result_shape;
    result.dtype = d.dtype;
    result.element_size = d.element_size;
    result.data.resize(static_cast<size_t>(resolved->request.num_elements()) * d.element_size);
    if (auto res = reader_->read_region(resolved->request, result.data); !res) {
        return std::unexpected(res.error());
    }
    return result;
}

std::expected<void, ReadError> Dataset::read_into(std::span<const Selector> selection, std::span<std::byte> output) {
    auto resolved = resolve_selection(selection, descriptor().shape);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    return reader_->read_region(resolved->request, output);
}

const ReadStatistics* Dataset::statistics() const {
    if (const auto* optimized = dynamic_cast<const OptimizedRegionReader*>(reader_.get())) {
        return &optimized->statistics();
    }
    return nullptr;
}

} // namespace chunkslice
