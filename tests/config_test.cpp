#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <optional>
#include <string>

#include "infra/config/config.hpp"
#include "test_helpers.hpp"

using dircopy::infra::Config;

TEST(ConfigTest, ReadsKnownKeys)
{
    const auto cfg = dircopy::infra::config_from_node(YAML::Load(
        "copy_strategy: parallel\n"
        "copy_buffer_size_kb: 64\n"
        "copy_max_workers: 8\n"
        "pipeline_copy_workers: 2\n"
        "pipeline_size_workers: 6\n"
        "log_level: debug\n"));

    EXPECT_EQ(cfg.copy_strategy, std::optional<std::string>{"parallel"});
    EXPECT_EQ(cfg.copy_buffer_size_kb, 64);
    EXPECT_EQ(cfg.copy_max_workers, 8);
    EXPECT_EQ(cfg.pipeline_copy_workers, 2);
    EXPECT_EQ(cfg.pipeline_size_workers, 6);
    EXPECT_EQ(cfg.log_level, std::optional<std::string>{"debug"});
}

TEST(ConfigTest, SkipsKeysWithWrongType)
{
    const auto cfg = dircopy::infra::config_from_node(YAML::Load(
        "copy_max_workers: many\n"
        "copy_buffer_size_kb: 128\n"));

    EXPECT_FALSE(cfg.copy_max_workers.has_value());
    EXPECT_EQ(cfg.copy_buffer_size_kb, 128);
}

TEST(ConfigTest, NonMappingRootGivesEmptyConfig)
{
    const auto cfg = dircopy::infra::config_from_node(YAML::Load("- a\n- b\n"));
    EXPECT_FALSE(cfg.copy_strategy.has_value());
    EXPECT_FALSE(cfg.copy_buffer_size_kb.has_value());
}

TEST(ConfigTest, MergeOverridesOnlySetValues)
{
    Config base{};
    base.copy_strategy = "buffered";
    base.copy_buffer_size_kb = 256;

    Config cli{};
    cli.copy_buffer_size_kb = 64;
    cli.copy_max_workers = 2;

    base.merge_with(cli);
    EXPECT_EQ(base.copy_strategy, std::optional<std::string>{"buffered"});
    EXPECT_EQ(base.copy_buffer_size_kb, 64);
    EXPECT_EQ(base.copy_max_workers, 2);
}

class ConfigFileTest : public dircopy::test::TempDirTest {};

TEST_F(ConfigFileTest, LoadsFileFromPath)
{
    const auto path = root_ / "config.yaml";
    dircopy::test::write_file(path, "copy_strategy: pipeline\npipeline_copy_workers: 5\n");

    const auto cfg = dircopy::infra::load_config_from_path(path);
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->copy_strategy, std::optional<std::string>{"pipeline"});
    EXPECT_EQ(cfg->pipeline_copy_workers, 5);
}

TEST_F(ConfigFileTest, MissingFileIsError)
{
    const auto cfg = dircopy::infra::load_config_from_path(root_ / "absent.yaml");
    EXPECT_FALSE(cfg.has_value());
}

TEST_F(ConfigFileTest, MalformedFileIsError)
{
    const auto path = root_ / "broken.yaml";
    dircopy::test::write_file(path, "copy_strategy: [unclosed\n");

    const auto cfg = dircopy::infra::load_config_from_path(path);
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("broken.yaml"), std::string::npos);
}

TEST(ConfigSearchPathTest, LocalFileFirstThenXdg)
{
    const char* previous = std::getenv("XDG_CONFIG_HOME");
    const std::optional<std::string> saved = previous ? std::optional<std::string>{previous} : std::nullopt;

    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-home", 1);
    const auto paths = dircopy::infra::config_search_paths();

    if (saved) {
        ::setenv("XDG_CONFIG_HOME", saved->c_str(), 1);
    } else {
        ::unsetenv("XDG_CONFIG_HOME");
    }

    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0], std::filesystem::path(".dircopy.yaml"));
    EXPECT_EQ(paths[1], std::filesystem::path("/tmp/xdg-home/dircopy/config.yaml"));
}
