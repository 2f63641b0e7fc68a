#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>

#include "config.hpp"

namespace dircopy::infra {

namespace {

template<typename T>
void read_key(const YAML::Node& node, const char* key, std::optional<T>& out) {
    const auto value = node[key];
    if (!value || value.IsNull()) return;

    try {
        out = value.as<T>();
    } catch (const YAML::Exception& e) {
        spdlog::warn("Ignoring config key '{}': {}", key, e.what());
    }
}

} // namespace

void Config::merge_with(const Config& other) {
    if (other.copy_strategy) copy_strategy = other.copy_strategy;
    if (other.copy_buffer_size_kb) copy_buffer_size_kb = other.copy_buffer_size_kb;
    if (other.copy_max_workers) copy_max_workers = other.copy_max_workers;
    if (other.pipeline_copy_workers) pipeline_copy_workers = other.pipeline_copy_workers;
    if (other.pipeline_size_workers) pipeline_size_workers = other.pipeline_size_workers;
    if (other.log_level) log_level = other.log_level;
}

auto config_search_paths() -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;

    // 1. Локальный файл
    paths.emplace_back(".dircopy.yaml");

    // 2. Глобальный файл
    const char* config_home = std::getenv("XDG_CONFIG_HOME");
    if (config_home && *config_home) {
        paths.push_back(std::filesystem::path(config_home) / "dircopy" / "config.yaml");
    } else if (const char* home = std::getenv("HOME")) {
        paths.push_back(std::filesystem::path(home) / ".config" / "dircopy" / "config.yaml");
    }

    return paths;
}

auto config_from_node(const YAML::Node& node) -> Config {
    Config cfg{};
    if (!node.IsMap()) {
        if (node.IsDefined() && !node.IsNull()) {
            spdlog::warn("Config root is not a mapping, using defaults");
        }
        return cfg;
    }

    read_key(node, "copy_strategy", cfg.copy_strategy);
    read_key(node, "copy_buffer_size_kb", cfg.copy_buffer_size_kb);
    read_key(node, "copy_max_workers", cfg.copy_max_workers);
    read_key(node, "pipeline_copy_workers", cfg.pipeline_copy_workers);
    read_key(node, "pipeline_size_workers", cfg.pipeline_size_workers);
    read_key(node, "log_level", cfg.log_level);
    return cfg;
}

auto load_config_from_path(const std::filesystem::path& path)
    -> std::expected<Config, std::string>
{
    try {
        auto cfg = config_from_node(YAML::LoadFile(path.string()));
        spdlog::debug("Loaded config from {}", path.string());
        return cfg;
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

auto load_config_from_file() -> std::expected<Config, std::string> {
    for (const auto& path : config_search_paths()) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) continue;
        return load_config_from_path(path);
    }

    // Файл не найден — возвращаем пустой конфиг (не ошибка!)
    return Config{};
}

} // namespace dircopy::infra
