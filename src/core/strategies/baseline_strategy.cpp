#include "baseline_strategy.hpp"

#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"
#include "../../infra/stopwatch.hpp"

namespace dircopy::core {

auto BaselineStrategy::description() const -> std::string {
    return "Native recursive copy (std::filesystem) with a .git ignore filter";
}

auto BaselineStrategy::copy_directory(const std::filesystem::path& src,
                                      const std::filesystem::path& dst,
                                      bool exclude_git,
                                      const CopyOptions& /*options*/) const -> CopyResult
{
    const infra::Stopwatch timer;
    std::uint64_t bytes_copied = 0;

    auto res = adapters::fs::require_directory(src);
    if (res) res = adapters::fs::remove_tree(dst);
    if (res) res = adapters::fs::copy_tree(src, dst, exclude_git, bytes_copied);

    const auto elapsed = timer.elapsed_seconds();
    if (!res) {
        spdlog::error("Baseline copy failed: {}", res.error().message);
        return CopyResult::failed(res.error().message, bytes_copied, elapsed, name());
    }

    spdlog::debug("Baseline copy completed: {} -> {} ({:.1f} MB in {:.2f} seconds)",
                  src.string(), dst.string(),
                  static_cast<double>(bytes_copied) / kBytesPerMegabyte, elapsed);
    return CopyResult::succeeded(bytes_copied, elapsed, name());
}

} // namespace dircopy::core
