#include <gtest/gtest.h>

#include "core/models/benchmark_result.hpp"
#include "core/models/copy_result.hpp"
#include "core/strategies/strategy_kind.hpp"

using dircopy::core::BenchmarkResult;
using dircopy::core::CopyResult;
using dircopy::core::CopyStrategyKind;

TEST(CopyResultTest, SpeedInMegabytesPerSecond)
{
    const auto result = CopyResult::succeeded(4 * 1024 * 1024, 2.0, "Baseline");
    EXPECT_TRUE(result.success());
    EXPECT_DOUBLE_EQ(result.speed_mbps(), 2.0);
    EXPECT_DOUBLE_EQ(result.speed_gbps(), 2.0 / 1024.0);
    EXPECT_FALSE(result.error().has_value());
    EXPECT_EQ(result.strategy_used(), std::optional<std::string>{"Baseline"});
}

TEST(CopyResultTest, ZeroOrNegativeElapsedGivesZeroSpeed)
{
    EXPECT_DOUBLE_EQ(CopyResult::succeeded(1024, 0.0, "Baseline").speed_mbps(), 0.0);
    EXPECT_DOUBLE_EQ(CopyResult::succeeded(1024, -1.0, "Baseline").speed_mbps(), 0.0);
}

TEST(CopyResultTest, FailureKeepsPartialProgress)
{
    const auto result = CopyResult::failed("disk full", 512, 0.5, std::nullopt);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.bytes_copied(), 512u);
    EXPECT_EQ(result.error(), std::optional<std::string>{"disk full"});
    EXPECT_FALSE(result.strategy_used().has_value());
}

TEST(BenchmarkResultTest, SpeedSummarySwitchesToGigabytes)
{
    BenchmarkResult result{.operation = "copy_directory", .method = "baseline"};

    result.throughput_mbps = 12.34;
    EXPECT_EQ(result.speed_summary(), "12.3 MB/s");

    result.throughput_mbps = 1000.0;
    EXPECT_EQ(result.speed_summary(), "1000.0 MB/s");

    result.throughput_mbps = 2048.0;
    EXPECT_EQ(result.speed_summary(), "2.0 GB/s");
}

TEST(BenchmarkResultTest, FailedBenchmarkHasZeroCounts)
{
    const auto result = dircopy::core::failed_benchmark("pipeline_copy", "two_phase_parallel", 0.25, "boom");
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.file_count, 0u);
    EXPECT_EQ(result.total_size, 0u);
    EXPECT_DOUBLE_EQ(result.throughput_mbps, 0.0);
    ASSERT_TRUE(result.errors.has_value());
    EXPECT_EQ(result.errors->front(), "boom");
}

TEST(StrategyKindTest, ParsesIdentifiers)
{
    for (const auto kind : dircopy::core::kAllStrategyKinds) {
        EXPECT_EQ(dircopy::core::parse_strategy_kind(dircopy::core::to_string(kind)), kind);
    }
    EXPECT_EQ(dircopy::core::to_string(CopyStrategyKind::Sendfile), "sendfile");
    EXPECT_FALSE(dircopy::core::parse_strategy_kind("rsync").has_value());
    EXPECT_FALSE(dircopy::core::parse_strategy_kind("Baseline").has_value());
}
