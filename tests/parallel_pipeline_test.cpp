#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/strategies/baseline_strategy.hpp"
#include "core/strategies/component_pipeline.hpp"
#include "core/strategies/parallel_strategy.hpp"
#include "core/strategies/pipeline_strategy.hpp"
#include "test_helpers.hpp"

using namespace dircopy::core;
using dircopy::test::LogCapture;
using dircopy::test::file_contents;
using dircopy::test::read_file;
using dircopy::test::write_file;

class ParallelStrategyTest : public dircopy::test::TempDirTest {};
class PipelineStrategyTest : public dircopy::test::TempDirTest {};

TEST_F(ParallelStrategyTest, OneUncopiableFileIsAWarningNotAFailure)
{
    write_file(root_ / "src/a.txt", std::string(100, 'a'));
    write_file(root_ / "src/nested/b.txt", std::string(200, 'b'));
    write_file(root_ / "src/nested/deep/c.txt", std::string(300, 'c'));
    std::filesystem::create_symlink(root_ / "nowhere", root_ / "src/nested/broken");

    LogCapture log;
    const auto result = ParallelStrategy{4}.copy_directory(root_ / "src", root_ / "dst", true, {});

    ASSERT_TRUE(result.success()) << result.error().value_or("");
    EXPECT_EQ(result.bytes_copied(), 600u);
    EXPECT_TRUE(log.contains("[warning] Failed to copy file")) << log.text();
    EXPECT_TRUE(log.contains("broken")) << log.text();
    EXPECT_EQ(read_file(root_ / "dst/nested/deep/c.txt"), std::string(300, 'c'));
}

TEST_F(ParallelStrategyTest, BaselineFailsUnderTheSameFault)
{
    write_file(root_ / "src/a.txt", std::string(100, 'a'));
    write_file(root_ / "src/nested/b.txt", std::string(200, 'b'));
    std::filesystem::create_symlink(root_ / "nowhere", root_ / "src/nested/broken");

    LogCapture log;
    const auto result = BaselineStrategy{}.copy_directory(root_ / "src", root_ / "dst", true, {});
    EXPECT_FALSE(result.success());
    EXPECT_TRUE(log.contains("[error] Baseline copy failed")) << log.text();
}

TEST_F(ParallelStrategyTest, SelfReferencingSymlinkIsSkippedWithWarning)
{
    write_file(root_ / "src/a.txt", std::string(100, 'a'));
    std::filesystem::create_directory_symlink(".", root_ / "src/loop");

    LogCapture log;
    const auto result = ParallelStrategy{4}.copy_directory(root_ / "src", root_ / "dst", true, {});

    ASSERT_TRUE(result.success()) << result.error().value_or("");
    EXPECT_EQ(result.bytes_copied(), 100u);
    EXPECT_TRUE(log.contains("[warning] Failed to copy file")) << log.text();
    EXPECT_TRUE(log.contains("loop")) << log.text();
    EXPECT_EQ(read_file(root_ / "dst/a.txt"), std::string(100, 'a'));
    EXPECT_FALSE(std::filesystem::exists(root_ / "dst/loop"));
}

TEST_F(ParallelStrategyTest, ManyFilesAcrossWorkerCounts)
{
    std::uint64_t expected = 0;
    for (int i = 0; i < 60; ++i) {
        const auto content = std::string(static_cast<std::size_t>(i * 37 + 1), static_cast<char>('a' + i % 26));
        write_file(root_ / "src" / ("dir" + std::to_string(i % 7)) / ("f" + std::to_string(i) + ".txt"), content);
        expected += content.size();
    }

    for (const std::uint32_t workers : {1u, 2u, 16u}) {
        const auto dst = root_ / ("dst" + std::to_string(workers));
        const auto result = ParallelStrategy{workers, 1}.copy_directory(root_ / "src", dst, true, {});
        ASSERT_TRUE(result.success());
        EXPECT_EQ(result.bytes_copied(), expected);
        EXPECT_EQ(file_contents(dst), file_contents(root_ / "src"));
    }
}

TEST_F(PipelineStrategyTest, CopiesComponentDirectories)
{
    write_file(root_ / "src/alpha/one.bin", std::string(60, '1'));
    write_file(root_ / "src/alpha/deep/two.bin", std::string(40, '2'));
    write_file(root_ / "src/beta/three.bin", std::string(50, '3'));

    const auto result = PipelineStrategy{}.copy_directory(root_ / "src", root_ / "dst", true, {});
    ASSERT_TRUE(result.success()) << result.error().value_or("");
    EXPECT_EQ(result.bytes_copied(), 150u);
    EXPECT_EQ(result.strategy_used(), std::optional<std::string>{"Pipeline (3 copy workers)"});
    EXPECT_EQ(file_contents(root_ / "dst"), file_contents(root_ / "src"));
}

TEST_F(PipelineStrategyTest, RootFilesAreComponentsToo)
{
    write_file(root_ / "src/west.yml", "manifest");
    write_file(root_ / "src/alpha/x.txt", "0123456789");

    const auto result = PipelineStrategy{2, 2}.copy_directory(root_ / "src", root_ / "dst", true, {});
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.bytes_copied(), 18u);
    EXPECT_EQ(read_file(root_ / "dst/west.yml"), "manifest");
}

TEST_F(PipelineStrategyTest, NoComponentsFallsBackToPlainCopy)
{
    std::filesystem::create_directories(root_ / "src");
    write_file(root_ / "src/.git/HEAD", "ref");

    const auto result = PipelineStrategy{}.copy_directory(root_ / "src", root_ / "dst", true, {});
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.strategy_used(), std::optional<std::string>{"Pipeline (3 copy workers) (fallback)"});
    EXPECT_EQ(result.bytes_copied(), 0u);
    EXPECT_TRUE(std::filesystem::is_directory(root_ / "dst"));
    EXPECT_FALSE(std::filesystem::exists(root_ / "dst/.git"));
}

TEST_F(PipelineStrategyTest, FailedComponentIsExcludedFromBytes)
{
    write_file(root_ / "src/alpha/good.txt", std::string(10, 'g'));
    std::filesystem::create_symlink(root_ / "nowhere", root_ / "src/alpha/broken");
    write_file(root_ / "src/beta/fine.txt", std::string(50, 'f'));

    LogCapture log;
    const auto result = PipelineStrategy{}.copy_directory(root_ / "src", root_ / "dst", true, {});
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.bytes_copied(), 50u);
    EXPECT_TRUE(log.contains("Failed to copy component alpha")) << log.text();
}

TEST_F(PipelineStrategyTest, SizeDiscoverySkipsMissingComponents)
{
    write_file(root_ / "ws/zmk/app.c", std::string(30, 'z'));
    write_file(root_ / "ws/modules/lib/a.h", std::string(12, 'm'));

    const auto tasks = discover_component_sizes(root_ / "ws", root_ / "cache",
                                                {"zmk", "zephyr", "modules", ".west"}, 4);
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].name, "zmk");
    EXPECT_EQ(tasks[0].expected_size, 30u);
    EXPECT_EQ(tasks[0].destination, root_ / "cache/zmk");
    EXPECT_EQ(tasks[1].name, "modules");
    EXPECT_EQ(tasks[1].expected_size, 12u);

    std::filesystem::create_directories(root_ / "cache");
    const auto report = copy_components(tasks, 3, true);
    EXPECT_EQ(report.bytes_copied, 42u);
    EXPECT_EQ(report.expected_bytes, 42u);
    EXPECT_TRUE(report.failures.empty());
    EXPECT_EQ(read_file(root_ / "cache/modules/lib/a.h"), std::string(12, 'm'));
}

TEST_F(PipelineStrategyTest, CopyComponentOfMissingSourceIsZero)
{
    const CopyTask task{
        .name = "ghost",
        .source = root_ / "ghost",
        .destination = root_ / "out/ghost",
        .expected_size = 99,
    };
    const auto copied = copy_component(task, true);
    ASSERT_TRUE(copied.has_value());
    EXPECT_EQ(*copied, 0u);
}
