#include "component_pipeline.hpp"

#include <future>
#include <system_error>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"
#include "../../adapters/traversal.hpp"
#include "../../infra/thread_pool/thread_pool.hpp"

namespace dircopy::core {

namespace {

auto component_size(const std::filesystem::path& path) -> std::uint64_t {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return adapters::traversal::fast_directory_stats(path).total_size;
    }
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : size;
}

} // namespace

auto discover_component_sizes(const std::filesystem::path& src_base,
                              const std::filesystem::path& dst_base,
                              const std::vector<std::string>& components,
                              std::uint32_t size_workers) -> std::vector<CopyTask>
{
    std::vector<std::pair<std::string, std::future<std::uint64_t>>> sizes;
    std::vector<CopyTask> tasks;

    infra::ThreadPool pool{size_workers};
    for (const auto& component : components) {
        const auto path = src_base / component;
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            spdlog::debug("Component {} not found in {}", component, src_base.string());
            continue;
        }
        sizes.emplace_back(component, pool.enqueue_with_future([path] { return component_size(path); }));
    }

    tasks.reserve(sizes.size());
    for (auto& [component, future] : sizes) {
        std::uint64_t size = 0;
        try {
            size = future.get();
        } catch (const std::exception& e) {
            spdlog::warn("Failed to size component {}: {}", component, e.what());
        }
        tasks.push_back(CopyTask{
            .name = component,
            .source = src_base / component,
            .destination = dst_base / component,
            .expected_size = size,
        });
    }
    return tasks;
}

auto copy_component(const CopyTask& task, bool exclude_git) -> infra::Result<std::uint64_t> {
    std::error_code ec;
    const auto status = std::filesystem::status(task.source, ec);
    if (!std::filesystem::exists(status)) {
        return std::uint64_t{0};
    }

    if (auto res = adapters::fs::remove_tree(task.destination); !res) {
        return std::unexpected(std::move(res.error()));
    }

    if (std::filesystem::is_directory(status)) {
        std::uint64_t copied = 0;
        if (auto res = adapters::fs::copy_tree(task.source, task.destination, exclude_git, copied); !res) {
            return std::unexpected(std::move(res.error()));
        }
        // Размер фазы 1 мог устареть
        return adapters::traversal::fast_directory_stats(task.destination).total_size;
    }
    return adapters::fs::copy_single_file(task.source, task.destination);
}

auto copy_components(const std::vector<CopyTask>& tasks,
                     std::uint32_t copy_workers,
                     bool exclude_git) -> ComponentCopyReport
{
    ComponentCopyReport report;
    std::vector<std::future<infra::Result<std::uint64_t>>> futures;
    futures.reserve(tasks.size());

    infra::ThreadPool pool{copy_workers};
    for (const auto& task : tasks) {
        report.expected_bytes += task.expected_size;
        futures.push_back(pool.enqueue_with_future([&task, exclude_git] {
            return copy_component(task, exclude_git);
        }));
    }

    for (std::size_t i = 0; i < futures.size(); ++i) {
        std::string error;
        try {
            auto copied = futures[i].get();
            if (copied) {
                report.bytes_copied += *copied;
                continue;
            }
            error = copied.error().message;
        } catch (const std::exception& e) {
            error = e.what();
        }
        spdlog::warn("Failed to copy component {}: {}", tasks[i].name, error);
        report.failures.push_back(fmt::format("{}: {}", tasks[i].name, error));
    }
    return report;
}

} // namespace dircopy::core
