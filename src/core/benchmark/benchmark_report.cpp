#include "benchmark_report.hpp"

#include <iterator>
#include <string_view>
#include <fmt/format.h>
#include "../models/copy_result.hpp"

namespace dircopy::core {

namespace {

auto size_mb(const BenchmarkResult& r) -> double {
    return static_cast<double>(r.total_size) / kBytesPerMegabyte;
}

auto status(const BenchmarkResult& r) -> std::string_view {
    return r.succeeded() ? "SUCCESS" : "FAILED";
}

// "parallel_8_workers" -> "8"
auto worker_count(const std::string& method) -> std::string {
    const auto first = method.find('_');
    if (first == std::string::npos) return method;
    const auto second = method.find('_', first + 1);
    return method.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1);
}

} // namespace

auto format_traversal_table(const std::vector<BenchmarkResult>& results) -> std::string {
    if (results.empty()) return {};

    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "{:<20} {:<10} {:<8} {:<10} {:<12}\n",
                   "Method", "Duration", "Files", "Size", "Speed");
    fmt::format_to(std::back_inserter(out), "{}\n", std::string(68, '-'));
    for (const auto& r : results) {
        fmt::format_to(std::back_inserter(out), "{:<20} {:<10.3f} {:<8} {:<10.1f} {:<12}\n",
                       r.method, r.duration, r.file_count, size_mb(r), r.speed_summary());
    }
    return fmt::to_string(out);
}

auto format_copy_table(const std::vector<BenchmarkResult>& results) -> std::string {
    if (results.empty()) return {};

    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "{:<12} {:<10} {:<8} {:<10} {:<12} {:<10}\n",
                   "Strategy", "Duration", "Files", "Size", "Speed", "Status");
    fmt::format_to(std::back_inserter(out), "{}\n", std::string(70, '-'));
    for (const auto& r : results) {
        fmt::format_to(std::back_inserter(out), "{:<12} {:<10.3f} {:<8} {:<10.1f} {:<12} {:<10}\n",
                       r.method, r.duration, r.file_count, size_mb(r), r.speed_summary(), status(r));
    }
    return fmt::to_string(out);
}

auto format_worker_table(const std::vector<BenchmarkResult>& results) -> std::string {
    if (results.empty()) return {};

    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "{:<10} {:<10} {:<8} {:<10} {:<12} {:<10}\n",
                   "Workers", "Duration", "Files", "Size", "Speed", "Status");
    fmt::format_to(std::back_inserter(out), "{}\n", std::string(68, '-'));
    for (const auto& r : results) {
        fmt::format_to(std::back_inserter(out), "{:<10} {:<10.3f} {:<8} {:<10.1f} {:<12} {:<10}\n",
                       worker_count(r.method), r.duration, r.file_count, size_mb(r), r.speed_summary(), status(r));
    }
    return fmt::to_string(out);
}

auto format_pipeline_summary(const std::vector<BenchmarkResult>& results) -> std::string {
    fmt::memory_buffer out;
    for (const auto& r : results) {
        const auto size_gb = static_cast<double>(r.total_size) / (kBytesPerMegabyte * 1024.0);
        fmt::format_to(std::back_inserter(out), "Pipeline Copy: {:.3f}s, {} files, {:.2f} GB, {}, {}\n",
                       r.duration, r.file_count, size_gb, r.speed_summary(), status(r));
    }
    return fmt::to_string(out);
}

} // namespace dircopy::core
