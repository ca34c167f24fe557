#include "../../src/data_io/dataset_reader.h"
#include "../../src/data_io/dataset_writer.h"
#include "../../src/slicing/region_reader.h"
#include <benchmark/benchmark.h>
#include <memory>
#include <random>
#include <string>

// Smooth float data that compresses like real sensor grids.
static chunkslice::memory::byte_vector generate_grid(const chunkslice::Coords& shape) {
    const auto n = static_cast<size_t>(shape.product());
    chunkslice::memory::byte_vector data(n * sizeof(float));
    std::mt19937 gen(1337);
    std::normal_distribution<float> noise(0.0f, 0.01f);
    auto* values = reinterpret_cast<float*>(data.data());
    for (size_t i = 0; i < n; ++i) {
        values[i] = static_cast<float>(i % 1024) * 0.001f + noise(gen);
    }
    return data;
}

// A 2048x2048 float32 dataset in 256x256 chunks of 32x32 blocks, written once per run.
class RegionReadBenchmark : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        if (store_) {
            return;
        }
        chunkslice::DatasetSpec spec;
        spec.shape = chunkslice::Coords{2048, 2048};
        spec.chunk_shape = chunkslice::Coords{256, 256};
        spec.block_shape = chunkslice::Coords{32, 32};
        spec.dtype = chunkslice::DType::FLOAT32;

        auto writer = chunkslice::DatasetWriter::create_in_memory(spec);
        if (!writer) {
            setup_error_ = writer.error();
            return;
        }
        const auto data = generate_grid(spec.shape);
        if (auto written = (*writer)->write_array(data); !written) {
            setup_error_ = written.error();
            return;
        }
        auto backend = (*writer)->release_backend();
        if (!backend) {
            setup_error_ = backend.error();
            return;
        }
        auto reader = chunkslice::DatasetReader::open_in_memory(std::move(*backend));
        if (!reader) {
            setup_error_ = reader.error();
            return;
        }
        store_ = std::move(*reader);
    }

protected:
    // Reads a square of `side` elements starting inside chunk (3, 5).
    template <typename Reader>
    void run(benchmark::State& state) {
        if (!store_) {
            state.SkipWithError(("Dataset setup failed: " + setup_error_).c_str());
            return;
        }
        Reader reader(store_);
        const auto side = state.range(0);
        const chunkslice::Region region(chunkslice::Coords{3 * 256 + 7, 5 * 256 + 11},
                                        chunkslice::Coords{3 * 256 + 7 + side, 5 * 256 + 11 + side});
        const auto request = chunkslice::SliceRequest::contiguous(region);
        chunkslice::memory::byte_vector out(static_cast<size_t>(region.num_elements()) * sizeof(float));

        for (auto _ : state) {
            if (auto res = reader.read_region(request, out); !res) {
                state.SkipWithError(res.error().to_string().c_str());
                return;
            }
            benchmark::DoNotOptimize(out.data());
            benchmark::ClobberMemory();
        }
        state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(out.size()));
        state.SetLabel("Region: " + std::to_string(side) + "x" + std::to_string(side));
    }

    static inline std::shared_ptr<chunkslice::DatasetReader> store_;
    static inline std::string setup_error_;
};

BENCHMARK_DEFINE_F(RegionReadBenchmark, Optimized)(benchmark::State& state) {
    run<chunkslice::OptimizedRegionReader>(state);
}

BENCHMARK_DEFINE_F(RegionReadBenchmark, FilterPipeline)(benchmark::State& state) {
    run<chunkslice::FilterPipelineRegionReader>(state);
}

BENCHMARK_REGISTER_F(RegionReadBenchmark, Optimized)->RangeMultiplier(4)->Range(4, 256);
BENCHMARK_REGISTER_F(RegionReadBenchmark, FilterPipeline)->RangeMultiplier(4)->Range(4, 256);

BENCHMARK_MAIN();
