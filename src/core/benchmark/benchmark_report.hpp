#pragma once

#include <string>
#include <vector>
#include "../models/benchmark_result.hpp"

namespace dircopy::core {

// Текстовые таблицы для консоли; пустая строка для пустого списка
[[nodiscard]] auto format_traversal_table(const std::vector<BenchmarkResult>& results) -> std::string;
[[nodiscard]] auto format_copy_table(const std::vector<BenchmarkResult>& results) -> std::string;
[[nodiscard]] auto format_worker_table(const std::vector<BenchmarkResult>& results) -> std::string;
[[nodiscard]] auto format_pipeline_summary(const std::vector<BenchmarkResult>& results) -> std::string;

} // namespace dircopy::core
