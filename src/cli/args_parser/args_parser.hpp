#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <expected>
#include "../../infra/config/config.hpp"

namespace dircopy::args_parser {

enum class Command {
    Copy,       // dircopy copy SRC DST
    Strategies, // dircopy strategies
    Bench,      // dircopy bench WORKSPACE OUTPUT
};

struct CLIArgs
{
    Command command{Command::Copy};

    // copy
    std::string source;
    std::string destination;
    std::optional<std::string> strategy;        // --strategy=KIND
    bool exclude_git{false};                    // --exclude-git
    bool preserve_metadata{true};               // --no-metadata

    // bench
    std::string workspace;
    std::string output_dir;
    bool quiet{false};                          // -q, --quiet

    // глобальные
    std::optional<std::int64_t> buffer_size_kb; // --buffer-size-kb=N
    std::optional<std::int64_t> workers;        // --workers=N
    std::optional<std::string> log_level;       // --log-level=LEVEL
};

/// Разбирает аргументы командной строки (CLI11).
/// Ошибка содержит код выхода: 0 для --help, иначе код CLI11.
[[nodiscard]] auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int>;

/// Значения, заданные в командной строке, поверх конфигурации из файла
[[nodiscard]] auto config_from_cli(const CLIArgs& args) -> infra::Config;

} // namespace dircopy::args_parser
