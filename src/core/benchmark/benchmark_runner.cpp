#include "benchmark_runner.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <system_error>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "benchmark_report.hpp"
#include "../strategies/component_pipeline.hpp"
#include "../../adapters/fs.hpp"
#include "../../infra/stopwatch.hpp"

namespace dircopy::core {

namespace {

constexpr std::uint32_t kPipelineSizeWorkers = 4;
constexpr std::uint32_t kPipelineCopyWorkers = 3;

// Каталог назначения удаляется при любом исходе замера
class ScopedTreeRemoval {
public:
    explicit ScopedTreeRemoval(std::filesystem::path dir) : dir_(std::move(dir)) {}
    ~ScopedTreeRemoval() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
        if (ec) {
            spdlog::warn("Cannot clean up benchmark destination {}: {}", dir_.string(), ec.message());
        }
    }

    ScopedTreeRemoval(const ScopedTreeRemoval&) = delete;
    ScopedTreeRemoval& operator=(const ScopedTreeRemoval&) = delete;

private:
    std::filesystem::path dir_;
};

auto from_copy_result(std::string operation, std::string method,
                      const CopyResult& result, const std::filesystem::path& dst) -> BenchmarkResult {
    BenchmarkResult bench{
        .operation = std::move(operation),
        .method = std::move(method),
        .duration = result.elapsed_time(),
        .file_count = result.success() ? adapters::fs::count_files(dst) : 0,
        .total_size = result.bytes_copied(),
        .throughput_mbps = result.speed_mbps(),
        .errors = std::nullopt,
    };
    if (!result.success()) {
        bench.errors = std::vector<std::string>{result.error().value_or("Unknown error")};
    }
    return bench;
}

auto run_category(const char* key, BenchmarkReport& report,
                  const std::function<std::vector<BenchmarkResult>()>& body) -> void {
    const infra::Stopwatch timer;
    try {
        report[key] = body();
    } catch (const std::exception& e) {
        spdlog::error("Benchmark category {} failed: {}", key, e.what());
        report[key] = {failed_benchmark(key, "category", timer.elapsed_seconds(), e.what())};
    }
}

} // namespace

auto default_benchmark_strategies() -> std::vector<CopyStrategyKind> {
    std::vector<CopyStrategyKind> kinds{
        CopyStrategyKind::Baseline,
        CopyStrategyKind::Buffered,
        CopyStrategyKind::Parallel,
        CopyStrategyKind::Pipeline,
    };
    if (adapters::fs::sendfile_supported()) {
        kinds.push_back(CopyStrategyKind::Sendfile);
    }
    return kinds;
}

auto default_worker_counts() -> std::vector<std::uint32_t> {
    return {1, 2, 4, 8, 16};
}

auto default_pipeline_components() -> std::vector<std::string> {
    return {"zmk", "zephyr", "modules", ".west"};
}

BenchmarkRunner::BenchmarkRunner(CopyServiceSettings settings, TraversalBackend traversal)
    : settings_(settings)
    , traversal_(std::move(traversal))
{}

auto BenchmarkRunner::unique_destination(const std::filesystem::path& base, const std::string& prefix)
    -> std::filesystem::path
{
    const auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return base / fmt::format("{}_{}_{}", prefix, epoch, sequence_++);
}

auto BenchmarkRunner::benchmark_directory_traversal(const std::filesystem::path& directory, int iterations)
    -> std::vector<BenchmarkResult>
{
    std::vector<BenchmarkResult> results;

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        spdlog::debug("Traversal benchmark skipped, not a directory: {}", directory.string());
        return results;
    }

    for (const auto method : traversal_.methods()) {
        const std::string name{adapters::traversal::method_name(method)};
        spdlog::info("Benchmarking {} traversal...", name);

        for (int i = 0; i < iterations; ++i) {
            const infra::Stopwatch timer;
            try {
                auto stats = traversal_.collect(directory, method);
                const auto duration = timer.elapsed_seconds();
                if (!stats) {
                    results.push_back(failed_benchmark("directory_traversal", name, duration, stats.error().message));
                    continue;
                }
                results.push_back(BenchmarkResult{
                    .operation = "directory_traversal",
                    .method = name,
                    .duration = duration,
                    .file_count = stats->file_count,
                    .total_size = stats->total_size,
                    .throughput_mbps = megabytes_per_second(stats->total_size, duration),
                    .errors = std::nullopt,
                });
            } catch (const std::exception& e) {
                results.push_back(failed_benchmark("directory_traversal", name, timer.elapsed_seconds(), e.what()));
            }
        }
    }
    return results;
}

auto BenchmarkRunner::benchmark_copy_strategies(const std::filesystem::path& src,
                                                const std::filesystem::path& dst_base,
                                                std::optional<std::vector<CopyStrategyKind>> strategies)
    -> std::vector<BenchmarkResult>
{
    const auto kinds = strategies.value_or(default_benchmark_strategies());
    std::vector<BenchmarkResult> results;
    results.reserve(kinds.size());

    for (const auto kind : kinds) {
        const std::string method{to_string(kind)};
        spdlog::info("Benchmarking {} copy strategy...", method);

        const auto dst = unique_destination(dst_base, "copy_" + method);
        const infra::Stopwatch timer;
        try {
            const ScopedTreeRemoval cleanup{dst};
            const CopyService service{settings_};
            const auto copied = service.copy_directory(src, dst, /*exclude_git=*/true, kind);
            results.push_back(from_copy_result("copy_directory", method, copied, dst));
        } catch (const std::exception& e) {
            results.push_back(failed_benchmark("copy_directory", method, timer.elapsed_seconds(), e.what()));
        }
    }
    return results;
}

auto BenchmarkRunner::benchmark_parallel_workers(const std::filesystem::path& src,
                                                 const std::filesystem::path& dst_base,
                                                 std::optional<std::vector<std::uint32_t>> worker_counts)
    -> std::vector<BenchmarkResult>
{
    const auto counts = worker_counts.value_or(default_worker_counts());
    std::vector<BenchmarkResult> results;
    results.reserve(counts.size());

    for (const auto workers : counts) {
        const auto method = fmt::format("parallel_{}_workers", workers);
        if (workers == 0) {
            // ParallelStrategy трактует 0 как число потоков по умолчанию
            spdlog::warn("Skipping parallel benchmark with 0 workers");
            results.push_back(failed_benchmark("parallel_copy", method, 0.0, "Worker count must be positive"));
            continue;
        }
        spdlog::info("Benchmarking parallel copy with {} workers...", workers);

        const auto dst = unique_destination(dst_base, fmt::format("parallel_{}", workers));
        const infra::Stopwatch timer;
        try {
            const ScopedTreeRemoval cleanup{dst};
            auto settings = settings_;
            settings.default_strategy = CopyStrategyKind::Parallel;
            settings.max_workers = workers;
            const CopyService service{settings};
            const auto copied = service.copy_directory(src, dst, /*exclude_git=*/true, CopyStrategyKind::Parallel);
            results.push_back(from_copy_result("parallel_copy", method, copied, dst));
        } catch (const std::exception& e) {
            results.push_back(failed_benchmark("parallel_copy", method, timer.elapsed_seconds(), e.what()));
        }
    }
    return results;
}

auto BenchmarkRunner::pipeline_copy_benchmark(const std::filesystem::path& workspace,
                                              const std::filesystem::path& cache_dir,
                                              std::optional<std::vector<std::string>> components)
    -> BenchmarkResult
{
    spdlog::info("Benchmarking pipeline copy approach...");
    const auto names = components.value_or(default_pipeline_components());
    const infra::Stopwatch timer;

    try {
        std::error_code ec;
        std::filesystem::create_directories(cache_dir, ec);
        if (ec) {
            return failed_benchmark("pipeline_copy", "two_phase_parallel", timer.elapsed_seconds(),
                                    fmt::format("Cannot create {}: {}", cache_dir.string(), ec.message()));
        }

        const auto tasks = discover_component_sizes(workspace, cache_dir, names, kPipelineSizeWorkers);
        const auto report = copy_components(tasks, kPipelineCopyWorkers, /*exclude_git=*/true);

        const auto duration = timer.elapsed_seconds();
        // Фактический размер; оценка фазы 1, если ничего не скопировано
        const auto actual = report.bytes_copied > 0 ? report.bytes_copied : report.expected_bytes;
        return BenchmarkResult{
            .operation = "pipeline_copy",
            .method = "two_phase_parallel",
            .duration = duration,
            .file_count = adapters::fs::count_files(cache_dir),
            .total_size = actual,
            .throughput_mbps = megabytes_per_second(actual, duration),
            .errors = std::nullopt,
        };
    } catch (const std::exception& e) {
        return failed_benchmark("pipeline_copy", "two_phase_parallel", timer.elapsed_seconds(), e.what());
    }
}

auto BenchmarkRunner::run_comprehensive_benchmark(const std::filesystem::path& workspace,
                                                  const std::filesystem::path& output_dir,
                                                  bool verbose) -> BenchmarkReport
{
    BenchmarkReport report;
    if (verbose) spdlog::info("Starting comprehensive file operations benchmark...");

    if (verbose) spdlog::info("=== Directory Traversal Benchmark ===");
    run_category("traversal", report, [&] { return benchmark_directory_traversal(workspace); });
    if (verbose) fmt::print("{}", format_traversal_table(report["traversal"]));

    if (verbose) spdlog::info("=== Copy Strategy Benchmark ===");
    run_category("copy_strategies", report, [&] { return benchmark_copy_strategies(workspace, output_dir); });
    if (verbose) fmt::print("{}", format_copy_table(report["copy_strategies"]));

    if (verbose) spdlog::info("=== Parallel Worker Count Benchmark ===");
    run_category("parallel_workers", report, [&] { return benchmark_parallel_workers(workspace, output_dir); });
    if (verbose) fmt::print("{}", format_worker_table(report["parallel_workers"]));

    if (verbose) spdlog::info("=== Pipeline Copy Benchmark ===");
    run_category("pipeline", report, [&] {
        return std::vector<BenchmarkResult>{pipeline_copy_benchmark(workspace, output_dir / "pipeline")};
    });
    if (verbose) fmt::print("{}", format_pipeline_summary(report["pipeline"]));

    return report;
}

} // namespace dircopy::core
