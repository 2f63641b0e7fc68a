#include "pipeline_strategy.hpp"

#include <system_error>
#include <utility>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "component_pipeline.hpp"
#include "../../adapters/fs.hpp"
#include "../../infra/stopwatch.hpp"

namespace dircopy::core {

PipelineStrategy::PipelineStrategy(std::uint32_t copy_workers, std::uint32_t size_workers)
    : copy_workers_(copy_workers == 0 ? 3 : copy_workers)
    , size_workers_(size_workers == 0 ? 4 : size_workers)
{}

auto PipelineStrategy::name() const -> std::string {
    return fmt::format("Pipeline ({} copy workers)", copy_workers_);
}

auto PipelineStrategy::description() const -> std::string {
    return fmt::format("Two-phase pipeline copy with {} component-level workers", copy_workers_);
}

auto PipelineStrategy::copy_directory(const std::filesystem::path& src,
                                      const std::filesystem::path& dst,
                                      bool exclude_git,
                                      const CopyOptions& /*options*/) const -> CopyResult
{
    const infra::Stopwatch timer;
    const auto fail = [&](const infra::Error& err) {
        spdlog::error("Pipeline copy failed: {}", err.message);
        return CopyResult::failed(err.message, 0, timer.elapsed_seconds(), name());
    };

    if (auto res = adapters::fs::require_directory(src); !res) return fail(res.error());
    if (auto res = adapters::fs::remove_tree(dst); !res) return fail(res.error());

    // Компоненты: подкаталоги и файлы верхнего уровня
    std::vector<std::string> components;
    std::vector<std::string> root_files;
    std::error_code ec;
    std::filesystem::directory_iterator it(src, ec);
    for (std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec)) {
        auto entry_name = it->path().filename().string();
        if (exclude_git && entry_name == ".git") continue;

        std::error_code entry_ec;
        if (it->is_directory(entry_ec)) {
            components.push_back(std::move(entry_name));
        } else if (it->is_regular_file(entry_ec)) {
            root_files.push_back(std::move(entry_name));
        }
    }
    if (ec) return fail(infra::from_error_code(ec, fmt::format("Cannot list {}", src.string())));

    if (components.empty() && root_files.empty()) {
        return fallback_copy(src, dst, exclude_git, timer.elapsed_seconds());
    }

    std::filesystem::create_directories(dst, ec);
    if (ec) return fail(infra::from_error_code(ec, fmt::format("Cannot create {}", dst.string())));

    spdlog::debug("Pipeline copy detected {} components and {} root files: {}",
                  components.size(), root_files.size(), fmt::join(components, ", "));

    // Фаза 1: размеры
    auto tasks = discover_component_sizes(src, dst, components, size_workers_);
    for (const auto& file : root_files) {
        std::error_code size_ec;
        const auto size = std::filesystem::file_size(src / file, size_ec);
        tasks.push_back(CopyTask{
            .name = file,
            .source = src / file,
            .destination = dst / file,
            .expected_size = size_ec ? 0 : size,
        });
    }

    // Фаза 2: копирование
    const auto report = copy_components(tasks, copy_workers_, exclude_git);

    const auto elapsed = timer.elapsed_seconds();
    spdlog::debug("Pipeline copy completed: {} -> {} ({:.1f} MB in {:.2f} seconds, {} components, {} failed)",
                  src.string(), dst.string(),
                  static_cast<double>(report.bytes_copied) / kBytesPerMegabyte, elapsed,
                  tasks.size(), report.failures.size());
    return CopyResult::succeeded(report.bytes_copied, elapsed, name());
}

auto PipelineStrategy::fallback_copy(const std::filesystem::path& src,
                                     const std::filesystem::path& dst,
                                     bool exclude_git,
                                     double elapsed_before) const -> CopyResult
{
    const infra::Stopwatch timer;
    const auto label = name() + " (fallback)";
    spdlog::debug("Pipeline found no components in {}, using plain tree copy", src.string());

    std::uint64_t bytes_copied = 0;
    auto res = adapters::fs::copy_tree(src, dst, exclude_git, bytes_copied);
    const auto elapsed = elapsed_before + timer.elapsed_seconds();
    if (!res) {
        spdlog::error("Pipeline fallback copy failed: {}", res.error().message);
        return CopyResult::failed(res.error().message, bytes_copied, elapsed, label);
    }
    return CopyResult::succeeded(bytes_copied, elapsed, label);
}

} // namespace dircopy::core
