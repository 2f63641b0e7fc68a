#include "benchmark_result.hpp"
#include <utility>
#include <fmt/core.h>

namespace dircopy::core {

auto BenchmarkResult::speed_summary() const -> std::string {
    if (throughput_mbps > 1000.0) {
        return fmt::format("{:.1f} GB/s", throughput_mbps / 1024.0);
    }
    return fmt::format("{:.1f} MB/s", throughput_mbps);
}

auto failed_benchmark(std::string operation, std::string method,
                      double duration, std::string error) -> BenchmarkResult {
    return BenchmarkResult{
        .operation = std::move(operation),
        .method = std::move(method),
        .duration = duration,
        .file_count = 0,
        .total_size = 0,
        .throughput_mbps = 0.0,
        .errors = std::vector<std::string>{std::move(error)},
    };
}

} // namespace dircopy::core
