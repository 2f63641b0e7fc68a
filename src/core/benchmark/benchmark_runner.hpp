#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "../copy_service/copy_service.hpp"
#include "../models/benchmark_result.hpp"
#include "../../adapters/traversal.hpp"
#include "../strategies/strategy_kind.hpp"

namespace dircopy::core {

using BenchmarkReport = std::map<std::string, std::vector<BenchmarkResult>>;

inline constexpr int kDefaultTraversalIterations = 3;

[[nodiscard]] auto default_benchmark_strategies() -> std::vector<CopyStrategyKind>;
[[nodiscard]] auto default_worker_counts() -> std::vector<std::uint32_t>;
[[nodiscard]] auto default_pipeline_components() -> std::vector<std::string>;

// Источник методов обхода для замеров; по умолчанию adapters::traversal
struct TraversalBackend {
    std::function<std::vector<adapters::traversal::Method>()> methods =
        &adapters::traversal::available_methods;
    std::function<infra::Result<adapters::traversal::TraversalStats>(
        const std::filesystem::path&, adapters::traversal::Method)> collect =
        &adapters::traversal::collect_stats;
};

/// Сравнительные замеры стратегий и методов обхода.
/// Ни один метод не выбрасывает наружу ожидаемые ошибки: каждая
/// превращается в BenchmarkResult с заполненным errors.
class BenchmarkRunner {
public:
    // Базовые настройки сервисов, создаваемых для замеров
    explicit BenchmarkRunner(CopyServiceSettings settings = {}, TraversalBackend traversal = {});

    [[nodiscard]] auto benchmark_directory_traversal(const std::filesystem::path& directory,
                                                     int iterations = kDefaultTraversalIterations)
        -> std::vector<BenchmarkResult>;

    [[nodiscard]] auto benchmark_copy_strategies(const std::filesystem::path& src,
                                                 const std::filesystem::path& dst_base,
                                                 std::optional<std::vector<CopyStrategyKind>> strategies = std::nullopt)
        -> std::vector<BenchmarkResult>;

    [[nodiscard]] auto benchmark_parallel_workers(const std::filesystem::path& src,
                                                  const std::filesystem::path& dst_base,
                                                  std::optional<std::vector<std::uint32_t>> worker_counts = std::nullopt)
        -> std::vector<BenchmarkResult>;

    [[nodiscard]] auto pipeline_copy_benchmark(const std::filesystem::path& workspace,
                                               const std::filesystem::path& cache_dir,
                                               std::optional<std::vector<std::string>> components = std::nullopt)
        -> BenchmarkResult;

    // Ключи: traversal, copy_strategies, parallel_workers, pipeline
    [[nodiscard]] auto run_comprehensive_benchmark(const std::filesystem::path& workspace,
                                                   const std::filesystem::path& output_dir,
                                                   bool verbose = true) -> BenchmarkReport;

private:
    [[nodiscard]] auto unique_destination(const std::filesystem::path& base, const std::string& prefix)
        -> std::filesystem::path;

    CopyServiceSettings settings_;
    TraversalBackend traversal_;
    std::uint64_t sequence_ = 0;
};

} // namespace dircopy::core
