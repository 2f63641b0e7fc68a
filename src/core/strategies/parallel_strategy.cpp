#include "parallel_strategy.hpp"

#include <future>
#include <system_error>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"
#include "../../adapters/traversal.hpp"
#include "../../extensions/metadata.hpp"
#include "../../infra/stopwatch.hpp"
#include "../../infra/thread_pool/thread_pool.hpp"

namespace dircopy::core {

namespace {

auto copy_one(const std::filesystem::path& src, const std::filesystem::path& dst,
              std::size_t buffer_size, bool preserve_metadata) -> infra::Result<std::uint64_t>
{
    auto copied = adapters::fs::copy_file_buffered(src, dst, buffer_size);
    if (copied && preserve_metadata) {
        if (auto meta = extensions::copy_metadata(src, dst); !meta) {
            spdlog::warn("{}", meta.error().message);
        }
    }
    return copied;
}

} // namespace

ParallelStrategy::ParallelStrategy(std::uint32_t max_workers, std::size_t buffer_size_kb)
    : max_workers_(max_workers == 0 ? 4 : max_workers)
    , buffer_size_kb_(buffer_size_kb == 0 ? 1024 : buffer_size_kb)
{}

auto ParallelStrategy::name() const -> std::string {
    return fmt::format("Parallel ({} threads, {}KB)", max_workers_, buffer_size_kb_);
}

auto ParallelStrategy::description() const -> std::string {
    return fmt::format("Multithreaded copy with {} workers and {}KB buffer", max_workers_, buffer_size_kb_);
}

auto ParallelStrategy::copy_directory(const std::filesystem::path& src,
                                      const std::filesystem::path& dst,
                                      bool exclude_git,
                                      const CopyOptions& options) const -> CopyResult
{
    const infra::Stopwatch timer;
    const auto fail = [&](const infra::Error& err) {
        spdlog::error("Parallel copy failed: {}", err.message);
        return CopyResult::failed(err.message, 0, timer.elapsed_seconds(), name());
    };

    if (auto res = adapters::fs::require_directory(src); !res) return fail(res.error());
    if (auto res = adapters::fs::remove_tree(dst); !res) return fail(res.error());

    std::error_code ec;
    std::filesystem::create_directories(dst, ec);
    if (ec) return fail(infra::from_error_code(ec, fmt::format("Cannot create {}", dst.string())));

    // Проход 1: обход и разбиение
    auto listing = adapters::traversal::list_tree(src, exclude_git, /*prefer_native=*/true);
    if (!listing) return fail(listing.error());
    for (const auto& unreadable : listing->unreadable) {
        spdlog::warn("Skipping unreadable directory {}", unreadable);
    }

    // Проход 2: все каталоги до любой задачи копирования
    for (const auto& dir : listing->directories) {
        std::filesystem::create_directories(dst / dir, ec);
        if (ec) return fail(infra::from_error_code(ec, fmt::format("Cannot create {}", (dst / dir).string())));
    }

    // Проход 3: файлы независимыми задачами
    const auto buffer_size = buffer_size_kb_ * 1024;
    const auto preserve = options.preserve_metadata;
    std::uint64_t bytes_copied = 0;
    std::uint64_t failed_files = 0;
    {
        std::vector<std::pair<std::filesystem::path, std::future<infra::Result<std::uint64_t>>>> futures;
        futures.reserve(listing->files.size());

        infra::ThreadPool pool{max_workers_};
        for (const auto& file : listing->files) {
            auto src_file = src / file;
            auto dst_file = dst / file;
            auto future = pool.enqueue_with_future([src_file, dst_file, buffer_size, preserve] {
                return copy_one(src_file, dst_file, buffer_size, preserve);
            });
            futures.emplace_back(std::move(src_file), std::move(future));
        }

        for (auto& [src_file, future] : futures) {
            std::string error;
            try {
                auto copied = future.get();
                if (copied) {
                    bytes_copied += *copied;
                    continue;
                }
                error = copied.error().message;
            } catch (const std::exception& e) {
                error = e.what();
            }
            ++failed_files;
            spdlog::warn("Failed to copy file {}: {}", src_file.string(), error);
        }
    }

    const auto elapsed = timer.elapsed_seconds();
    spdlog::debug("Parallel copy completed: {} -> {} ({:.1f} MB in {:.2f} seconds, {} workers, {} failed files)",
                  src.string(), dst.string(),
                  static_cast<double>(bytes_copied) / kBytesPerMegabyte, elapsed,
                  max_workers_, failed_files);
    return CopyResult::succeeded(bytes_copied, elapsed, name());
}

} // namespace dircopy::core
