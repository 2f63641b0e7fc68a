#include "sequential_copy.hpp"

#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"
#include "../../adapters/traversal.hpp"
#include "../../extensions/metadata.hpp"
#include "../../infra/stopwatch.hpp"

namespace dircopy::core {

namespace {

auto replicate_and_copy(const std::filesystem::path& src,
                        const std::filesystem::path& dst,
                        bool exclude_git,
                        const CopyOptions& options,
                        const FileCopier& copier,
                        std::uint64_t& bytes_copied) -> infra::VoidResult
{
    if (auto res = adapters::fs::require_directory(src); !res) return res;
    if (auto res = adapters::fs::remove_tree(dst); !res) return res;

    std::error_code ec;
    std::filesystem::create_directories(dst, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot create {}", dst.string())));
    }

    auto listing = adapters::traversal::list_tree(src, exclude_git, /*prefer_native=*/false);
    if (!listing) {
        return std::unexpected(std::move(listing.error()));
    }
    if (!listing->unreadable.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                               fmt::format("Cannot read directory {}", listing->unreadable.front())));
    }

    // Структура каталогов до любых файлов
    for (const auto& dir : listing->directories) {
        std::filesystem::create_directories(dst / dir, ec);
        if (ec) {
            return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot create {}", (dst / dir).string())));
        }
    }

    for (const auto& file : listing->files) {
        const auto src_file = src / file;
        const auto dst_file = dst / file;

        auto copied = copier(src_file, dst_file);
        if (!copied) {
            return std::unexpected(std::move(copied.error()));
        }
        bytes_copied += *copied;

        if (options.preserve_metadata) {
            if (auto meta = extensions::copy_metadata(src_file, dst_file); !meta) {
                spdlog::warn("{}", meta.error().message);
            }
        }
    }
    return {};
}

} // namespace

auto copy_tree_sequential(const std::filesystem::path& src,
                          const std::filesystem::path& dst,
                          bool exclude_git,
                          const CopyOptions& options,
                          const std::string& strategy_name,
                          const FileCopier& copier) -> CopyResult
{
    const infra::Stopwatch timer;
    std::uint64_t bytes_copied = 0;

    auto res = replicate_and_copy(src, dst, exclude_git, options, copier, bytes_copied);
    const auto elapsed = timer.elapsed_seconds();

    if (!res) {
        spdlog::error("{} copy failed: {}", strategy_name, res.error().message);
        return CopyResult::failed(res.error().message, bytes_copied, elapsed, strategy_name);
    }

    spdlog::debug("{} copy completed: {} -> {} ({:.1f} MB in {:.2f} seconds)",
                  strategy_name, src.string(), dst.string(),
                  static_cast<double>(bytes_copied) / kBytesPerMegabyte, elapsed);
    return CopyResult::succeeded(bytes_copied, elapsed, strategy_name);
}

} // namespace dircopy::core
