#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace YAML {
    class Node;
}

namespace dircopy::infra {

/// Сырые настройки из файла и CLI. Все ключи необязательны:
/// значения по умолчанию и проверка выполняются один раз в
/// core::CopyServiceSettings::from_config.
struct Config {
    std::optional<std::string> copy_strategy;
    std::optional<std::int64_t> copy_buffer_size_kb;
    std::optional<std::int64_t> copy_max_workers;
    std::optional<std::int64_t> pipeline_copy_workers;
    std::optional<std::int64_t> pipeline_size_workers;

    std::optional<std::string> log_level;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.dircopy.yaml
///   2. $XDG_CONFIG_HOME/dircopy/config.yaml или ~/.config/dircopy/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Загружает конкретный файл; ошибка, если файл не читается или не парсится.
[[nodiscard]] auto load_config_from_path(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Разбирает уже загруженный узел. Ключи неверного типа пропускаются с warning.
[[nodiscard]] auto config_from_node(const YAML::Node& node) -> Config;

[[nodiscard]] auto config_search_paths() -> std::vector<std::filesystem::path>;

} // namespace dircopy::infra
