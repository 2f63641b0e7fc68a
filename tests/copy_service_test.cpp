#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <utility>
#include <string>
#include <vector>

#include "adapters/fs.hpp"
#include "core/copy_service/copy_service.hpp"
#include "core/strategies/buffered_strategy.hpp"
#include "test_helpers.hpp"

using namespace dircopy::core;
using dircopy::test::LogCapture;
using dircopy::test::file_contents;
using dircopy::test::write_file;

namespace {

// Стратегия, чьи предпосылки переключаются извне
class ToggleStrategy final : public CopyStrategy {
public:
    explicit ToggleStrategy(std::shared_ptr<std::atomic<bool>> ready) : ready_(std::move(ready)) {}

    auto name() const -> std::string override { return "Toggle"; }
    auto description() const -> std::string override { return "Test strategy"; }
    auto validate_prerequisites() const -> std::vector<std::string> override {
        if (ready_->load()) return {};
        return {"toggle switched off"};
    }
    auto copy_directory(const std::filesystem::path&, const std::filesystem::path&,
                        bool, const CopyOptions&) const -> CopyResult override {
        return CopyResult::succeeded(0, 0.0, name());
    }

private:
    std::shared_ptr<std::atomic<bool>> ready_;
};

auto contains(const std::vector<CopyStrategyKind>& kinds, CopyStrategyKind kind) -> bool {
    return std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

} // namespace

TEST(CopyServiceSettingsTest, DefaultsForEmptyConfig)
{
    const auto settings = CopyServiceSettings::from_config(dircopy::infra::Config{});
    EXPECT_EQ(settings.default_strategy, CopyStrategyKind::Baseline);
    EXPECT_EQ(settings.buffer_size_kb, 1024u);
    EXPECT_EQ(settings.max_workers, 4u);
    EXPECT_EQ(settings.pipeline_copy_workers, 3u);
    EXPECT_EQ(settings.pipeline_size_workers, 4u);
}

TEST(CopyServiceSettingsTest, InvalidValuesRevertToDefaults)
{
    dircopy::infra::Config config{};
    config.copy_strategy = "teleport";
    config.copy_buffer_size_kb = -5;
    config.copy_max_workers = 0;

    const auto settings = CopyServiceSettings::from_config(config);
    EXPECT_EQ(settings.default_strategy, CopyStrategyKind::Baseline);
    EXPECT_EQ(settings.buffer_size_kb, 1024u);
    EXPECT_EQ(settings.max_workers, 4u);
}

TEST(CopyServiceSettingsTest, ValidValuesAndClamps)
{
    dircopy::infra::Config config{};
    config.copy_strategy = "pipeline";
    config.copy_buffer_size_kb = 64;
    config.copy_max_workers = 100'000;
    config.pipeline_copy_workers = 2;

    const auto settings = CopyServiceSettings::from_config(config);
    EXPECT_EQ(settings.default_strategy, CopyStrategyKind::Pipeline);
    EXPECT_EQ(settings.buffer_size_kb, 64u);
    EXPECT_EQ(settings.max_workers, kMaxWorkers);
    EXPECT_EQ(settings.pipeline_copy_workers, 2u);
}

class CopyServiceTest : public dircopy::test::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        write_file(root_ / "src/a.txt", "hello");
        write_file(root_ / "src/sub/b.txt", "0123456789");
    }
};

TEST_F(CopyServiceTest, DefaultRegistry)
{
    const CopyService service{};
    const auto kinds = service.list_available_strategies();
    EXPECT_TRUE(contains(kinds, CopyStrategyKind::Baseline));
    EXPECT_TRUE(contains(kinds, CopyStrategyKind::Buffered));
    EXPECT_TRUE(contains(kinds, CopyStrategyKind::Parallel));
    EXPECT_TRUE(contains(kinds, CopyStrategyKind::Pipeline));
    EXPECT_EQ(contains(kinds, CopyStrategyKind::Sendfile), dircopy::adapters::fs::sendfile_supported());
}

TEST_F(CopyServiceTest, UsesDefaultStrategyWithoutOverride)
{
    CopyServiceSettings settings;
    settings.default_strategy = CopyStrategyKind::Buffered;
    settings.buffer_size_kb = 8;
    const CopyService service{settings};

    const auto result = service.copy_directory(root_ / "src", root_ / "dst");
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.strategy_used(), std::optional<std::string>{"Buffered (8KB)"});
    EXPECT_EQ(result.bytes_copied(), 15u);
}

TEST_F(CopyServiceTest, OverrideTakesPrecedence)
{
    const CopyService service{};
    const auto result = service.copy_directory(root_ / "src", root_ / "dst", true, CopyStrategyKind::Parallel);
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.strategy_used(), std::optional<std::string>{"Parallel (4 threads, 1024KB)"});
    EXPECT_EQ(file_contents(root_ / "dst"), file_contents(root_ / "src"));
}

TEST_F(CopyServiceTest, UnregisteredStrategyFallsBackToBaseline)
{
    StrategyMap registry;
    registry.emplace(CopyStrategyKind::Buffered, std::make_unique<BufferedStrategy>());
    const CopyService service{CopyServiceSettings{}, std::move(registry)};

    LogCapture log;
    const auto result = service.copy_directory(root_ / "src", root_ / "dst", true, CopyStrategyKind::Pipeline);
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.strategy_used(), std::optional<std::string>{"Baseline"});
    EXPECT_TRUE(log.contains("[warning] Strategy 'pipeline' is not available")) << log.text();
}

TEST_F(CopyServiceTest, PrerequisitesLostAfterConstructionFallBackToBaseline)
{
    auto ready = std::make_shared<std::atomic<bool>>(true);
    StrategyMap registry;
    registry.emplace(CopyStrategyKind::Sendfile, std::make_unique<ToggleStrategy>(ready));
    const CopyService service{CopyServiceSettings{}, std::move(registry)};
    ASSERT_TRUE(service.get_strategy_info(CopyStrategyKind::Sendfile).has_value());

    ready->store(false);
    LogCapture log;
    const auto result = service.copy_directory(root_ / "src", root_ / "dst", true, CopyStrategyKind::Sendfile);
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.strategy_used(), std::optional<std::string>{"Baseline"});
    EXPECT_EQ(result.bytes_copied(), 15u);
    EXPECT_TRUE(log.contains("prerequisites not met")) << log.text();

    const auto info = service.get_strategy_info(CopyStrategyKind::Sendfile);
    ASSERT_TRUE(info.has_value());
    EXPECT_FALSE(info->available);
    EXPECT_EQ(info->missing_prerequisites, std::vector<std::string>{"toggle switched off"});
}

TEST_F(CopyServiceTest, UnmetPrerequisitesAtConstructionAreNotRegistered)
{
    auto ready = std::make_shared<std::atomic<bool>>(false);
    StrategyMap registry;
    registry.emplace(CopyStrategyKind::Sendfile, std::make_unique<ToggleStrategy>(ready));
    const CopyService service{CopyServiceSettings{}, std::move(registry)};

    EXPECT_FALSE(service.get_strategy_info(CopyStrategyKind::Sendfile).has_value());
    EXPECT_EQ(service.list_available_strategies(), std::vector<CopyStrategyKind>{CopyStrategyKind::Baseline});
}

TEST_F(CopyServiceTest, StrategyInfoDescribesRegisteredStrategy)
{
    const CopyService service{};
    const auto info = service.get_strategy_info(CopyStrategyKind::Baseline);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->kind, CopyStrategyKind::Baseline);
    EXPECT_EQ(info->name, "Baseline");
    EXPECT_FALSE(info->description.empty());
    EXPECT_TRUE(info->available);
    EXPECT_TRUE(info->missing_prerequisites.empty());
}

TEST_F(CopyServiceTest, SourceErrorsSurfaceAsFailedResult)
{
    const CopyService service{};
    const auto result = service.copy_directory(root_ / "missing", root_ / "dst");
    EXPECT_FALSE(result.success());
    EXPECT_TRUE(result.error().has_value());
}

TEST(CopyServiceFactoryTest, NullConfigGivesDefaults)
{
    const auto service = create_copy_service(nullptr);
    EXPECT_EQ(service.default_strategy(), CopyStrategyKind::Baseline);
    EXPECT_EQ(service.settings().buffer_size_kb, 1024u);
}

TEST(CopyServiceFactoryTest, ConfigTunesStrategies)
{
    dircopy::infra::Config config{};
    config.copy_strategy = "parallel";
    config.copy_max_workers = 2;
    config.copy_buffer_size_kb = 32;

    const auto service = create_copy_service(&config);
    EXPECT_EQ(service.default_strategy(), CopyStrategyKind::Parallel);
    const auto info = service.get_strategy_info(CopyStrategyKind::Parallel);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->name, "Parallel (2 threads, 32KB)");
}
