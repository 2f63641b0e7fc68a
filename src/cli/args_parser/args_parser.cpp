#include "args_parser.hpp"

#include <string_view>
#include <vector>
#include <CLI/CLI.hpp>
#include "../../core/strategies/strategy_kind.hpp"

namespace dircopy::args_parser {

namespace {

auto strategy_names() -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto kind : core::kAllStrategyKinds) {
        names.emplace_back(core::to_string(kind));
    }
    return names;
}

} // namespace

auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int> {
    CLIArgs args;
    bool no_metadata = false;

    CLI::App app{"dircopy: directory copy engine with pluggable I/O strategies"};
    app.require_subcommand(1);

    app.add_option("--buffer-size-kb", args.buffer_size_kb, "Buffer size for buffered copies, KB")
        ->check(CLI::PositiveNumber);
    app.add_option("--workers", args.workers, "Worker threads for the parallel strategy")
        ->check(CLI::PositiveNumber);
    app.add_option("--log-level", args.log_level, "trace, debug, info, warn, error, critical, off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

    auto* copy = app.add_subcommand("copy", "Copy a directory tree");
    copy->add_option("source", args.source, "Source directory")->required();
    copy->add_option("destination", args.destination, "Destination directory (replaced)")->required();
    copy->add_option("-s,--strategy", args.strategy, "Copy strategy")
        ->check(CLI::IsMember(strategy_names()));
    copy->add_flag("--exclude-git", args.exclude_git, "Skip .git entries at any depth");
    copy->add_flag("--no-metadata", no_metadata, "Do not preserve mtime and permissions");

    auto* strategies = app.add_subcommand("strategies", "List registered copy strategies");

    auto* bench = app.add_subcommand("bench", "Benchmark traversal methods and copy strategies");
    bench->add_option("workspace", args.workspace, "Directory to benchmark")->required();
    bench->add_option("output", args.output_dir, "Scratch directory for benchmark copies")->required();
    bench->add_flag("-q,--quiet", args.quiet, "Do not print result tables");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return std::unexpected(app.exit(e));
    }

    args.preserve_metadata = !no_metadata;
    if (copy->parsed()) {
        args.command = Command::Copy;
    } else if (strategies->parsed()) {
        args.command = Command::Strategies;
    } else {
        args.command = Command::Bench;
    }
    return args;
}

auto config_from_cli(const CLIArgs& args) -> infra::Config {
    infra::Config cfg{};
    cfg.copy_strategy = args.strategy;
    cfg.copy_buffer_size_kb = args.buffer_size_kb;
    cfg.copy_max_workers = args.workers;
    cfg.log_level = args.log_level;
    return cfg;
}

} // namespace dircopy::args_parser
