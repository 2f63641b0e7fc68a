#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dircopy::core {

struct BenchmarkResult {
    std::string operation;
    std::string method;
    double duration = 0.0;
    std::uint64_t file_count = 0;
    std::uint64_t total_size = 0;
    double throughput_mbps = 0.0;
    std::optional<std::vector<std::string>> errors;

    // "X MB/s", выше 1000 MB/s — "X GB/s"
    [[nodiscard]] auto speed_summary() const -> std::string;
    [[nodiscard]] auto succeeded() const -> bool { return !errors || errors->empty(); }
};

// Результат с нулевыми счётчиками и одной ошибкой
[[nodiscard]] auto failed_benchmark(std::string operation, std::string method,
                                    double duration, std::string error) -> BenchmarkResult;

} // namespace dircopy::core
