#include <filesystem>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "infra/config/config.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/benchmark/benchmark_runner.hpp"
#include "core/copy_service/copy_service.hpp"

using ARGS = dircopy::args_parser::CLIArgs;

constexpr auto load_from_cli = dircopy::args_parser::config_from_cli;
constexpr auto load_config_file = dircopy::infra::load_config_from_file;
constexpr auto args_parser = dircopy::args_parser::parse_args;

[[nodiscard]]
static auto
run_copy(const ARGS& args, const dircopy::core::CopyService& service)
-> int {
    std::optional<dircopy::core::CopyStrategyKind> strategy;
    if (args.strategy) {
        strategy = dircopy::core::parse_strategy_kind(*args.strategy);
    }

    const auto result = service.copy_directory(
        args.source, args.destination, args.exclude_git, strategy,
        dircopy::core::CopyOptions{.preserve_metadata = args.preserve_metadata});

    if (!result.success()) {
        spdlog::error("Copy failed: {}", result.error().value_or("Unknown error"));
        return 1;
    }

    fmt::print("Strategy: {}\n", result.strategy_used().value_or("unknown"));
    fmt::print("Bytes copied: {} ({:.2f} MB)\n", result.bytes_copied(),
               static_cast<double>(result.bytes_copied()) / dircopy::core::kBytesPerMegabyte);
    fmt::print("Time elapsed: {:.3f} seconds\n", result.elapsed_time());
    fmt::print("Average speed: {:.2f} MB/s\n", result.speed_mbps());
    return 0;
}

[[nodiscard]]
static auto
run_strategies(const dircopy::core::CopyService& service)
-> int {
    const auto default_kind = service.default_strategy();
    for (const auto kind : dircopy::core::kAllStrategyKinds) {
        const auto info = service.get_strategy_info(kind);
        const auto marker = kind == default_kind ? "*" : " ";
        if (!info) {
            fmt::print("{} {:<10} not registered on this host\n", marker, dircopy::core::to_string(kind));
            continue;
        }
        fmt::print("{} {:<10} {:<30} {}\n", marker, dircopy::core::to_string(kind), info->name,
                   info->available ? "available" : "unavailable");
        fmt::print("  {:<10} {}\n", "", info->description);
        for (const auto& missing : info->missing_prerequisites) {
            fmt::print("  {:<10} missing: {}\n", "", missing);
        }
    }
    return 0;
}

[[nodiscard]]
static auto
run_bench(const ARGS& args, const dircopy::infra::Config& config)
-> int {
    dircopy::core::BenchmarkRunner runner{dircopy::core::CopyServiceSettings::from_config(config)};

    std::error_code ec;
    std::filesystem::create_directories(args.output_dir, ec);
    if (ec) {
        spdlog::error("Cannot create output directory {}: {}", args.output_dir, ec.message());
        return 1;
    }

    const auto report = runner.run_comprehensive_benchmark(args.workspace, args.output_dir, !args.quiet);

    std::size_t total = 0;
    std::size_t failed = 0;
    for (const auto& [category, results] : report) {
        for (const auto& result : results) {
            ++total;
            if (!result.succeeded()) ++failed;
        }
    }
    spdlog::info("Benchmark finished: {} measurements, {} failed", total, failed);
    return 0;
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        auto args_res = args_parser(argc, argv);
        if (!args_res) {
            return args_res.error(); // --help или ошибка разбора
        }
        const auto& args = *args_res;

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        dircopy::infra::Config config{};
        if (config_res) {
            config = *config_res;
        } else {
            spdlog::warn("Config error, using defaults: {}", config_res.error());
        }

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));

        if (config.log_level) {
            spdlog::set_level(spdlog::level::from_str(*config.log_level));
        }

        switch (args.command) {
            case dircopy::args_parser::Command::Copy: {
                const auto service = dircopy::core::create_copy_service(&config);
                return run_copy(args, service);
            }
            case dircopy::args_parser::Command::Strategies: {
                const auto service = dircopy::core::create_copy_service(&config);
                return run_strategies(service);
            }
            case dircopy::args_parser::Command::Bench:
                return run_bench(args, config);
        }
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
