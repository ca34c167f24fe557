#include <gtest/gtest.h>

#include <atomic>
#include <cstdlib>
#include <stdexcept>
#include <thread>
#include <vector>

#include "../../src/slicing/optimization_gate.h"

using namespace chunkslice;

namespace {

DatasetDescriptor make_descriptor() {
    DatasetDescriptor d;
    d.shape = Coords{100};
    d.chunk_shape = Coords{40};
    d.block_shape = Coords{10};
    d.element_size = 4;
    d.dtype = DType::INT32;
    return d;
}

const auto unit_request = SliceRequest::contiguous(Region(Coords{0}, Coords{10}));

} // namespace

class OptimizationGateTest : public ::testing::Test {
protected:
    void SetUp() override { unsetenv(optimization::FORCE_FILTER_ENV); }
    void TearDown() override { unsetenv(optimization::FORCE_FILTER_ENV); }

    optimization::ScopedOptimization restore_{true};
};

TEST_F(OptimizationGateTest, EnabledByDefaultAndToggles) {
    EXPECT_TRUE(optimization::is_enabled());
    optimization::disable();
    EXPECT_FALSE(optimization::is_enabled());
    optimization::enable();
    EXPECT_TRUE(optimization::is_enabled());
    optimization::set_enabled(false);
    EXPECT_FALSE(optimization::is_enabled());
}

TEST_F(OptimizationGateTest, ScopedOptimizationRestoresPreviousValue) {
    {
        optimization::ScopedOptimization off(false);
        EXPECT_FALSE(optimization::is_enabled());
        {
            optimization::ScopedOptimization on(true);
            EXPECT_TRUE(optimization::is_enabled());
        }
        EXPECT_FALSE(optimization::is_enabled());
    }
    EXPECT_TRUE(optimization::is_enabled());
}

TEST_F(OptimizationGateTest, ScopedOptimizationRestoresOnException) {
    EXPECT_THROW(
        {
            optimization::ScopedOptimization off(false);
            throw std::runtime_error("read failed");
        },
        std::runtime_error);
    EXPECT_TRUE(optimization::is_enabled());
}

TEST_F(OptimizationGateTest, EnvironmentValuesAreParsedAsIntegers) {
    EXPECT_FALSE(optimization::forced_by_environment());

    setenv(optimization::FORCE_FILTER_ENV, "1", 1);
    EXPECT_TRUE(optimization::forced_by_environment());
    setenv(optimization::FORCE_FILTER_ENV, " +2 ", 1);
    EXPECT_TRUE(optimization::forced_by_environment());
    setenv(optimization::FORCE_FILTER_ENV, "-1", 1);
    EXPECT_TRUE(optimization::forced_by_environment());

    setenv(optimization::FORCE_FILTER_ENV, "0", 1);
    EXPECT_FALSE(optimization::forced_by_environment());
    setenv(optimization::FORCE_FILTER_ENV, "abc", 1);
    EXPECT_FALSE(optimization::forced_by_environment());
    setenv(optimization::FORCE_FILTER_ENV, "1x", 1);
    EXPECT_FALSE(optimization::forced_by_environment());
    setenv(optimization::FORCE_FILTER_ENV, "", 1);
    EXPECT_FALSE(optimization::forced_by_environment());
}

TEST_F(OptimizationGateTest, ApplicabilityReasonsInOrder) {
    auto d = make_descriptor();
    EXPECT_TRUE(optimization::check_applicability(d, unit_request).has_value());
    EXPECT_TRUE(optimization::should_optimize(d, unit_request));

    const SliceRequest stepped(Region(Coords{0}, Coords{10}), Coords{2});
    auto res = optimization::check_applicability(d, stepped);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().reason(), NotApplicableReason::NonUnitStep);

    d.codec = ChunkCodec::ZSTD;
    res = optimization::check_applicability(d, unit_request);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().reason(), NotApplicableReason::UnsupportedCodec);

    d.byte_order = native_byte_order() == ByteOrder::LITTLE ? ByteOrder::BIG : ByteOrder::LITTLE;
    res = optimization::check_applicability(d, unit_request);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().reason(), NotApplicableReason::ByteOrderMismatch);

    setenv(optimization::FORCE_FILTER_ENV, "1", 1);
    res = optimization::check_applicability(d, unit_request);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().reason(), NotApplicableReason::ForcedByEnvironment);

    optimization::disable();
    res = optimization::check_applicability(d, unit_request);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().reason(), NotApplicableReason::OptimizationDisabled);
    EXPECT_FALSE(optimization::should_optimize(make_descriptor(), unit_request));
}

TEST_F(OptimizationGateTest, EnvironmentIsReadOnEveryCall) {
    const auto d = make_descriptor();
    EXPECT_TRUE(optimization::should_optimize(d, unit_request));
    setenv(optimization::FORCE_FILTER_ENV, "3", 1);
    EXPECT_FALSE(optimization::should_optimize(d, unit_request));
    unsetenv(optimization::FORCE_FILTER_ENV);
    EXPECT_TRUE(optimization::should_optimize(d, unit_request));
}

TEST_F(OptimizationGateTest, SwitchIsSafeAcrossThreads) {
    std::atomic<bool> stop{false};
    std::thread toggler([&] {
        for (int i = 0; i < 10000; ++i) {
            optimization::set_enabled(i % 2 == 0);
        }
        stop = true;
    });
    const auto d = make_descriptor();
    std::vector<std::thread> readers;
    for (int t = 0; t < 3; ++t) {
        readers.emplace_back([&] {
            while (!stop) {
                const auto res = optimization::check_applicability(d, unit_request);
                if (!res) {
                    EXPECT_EQ(res.error().reason(), NotApplicableReason::OptimizationDisabled);
                }
            }
        });
    }
    toggler.join();
    for (auto& reader : readers) {
        reader.join();
    }
}
