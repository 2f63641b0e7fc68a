#include "buffered_strategy.hpp"

#include <fmt/core.h>
#include "sequential_copy.hpp"
#include "../../adapters/fs.hpp"

namespace dircopy::core {

BufferedStrategy::BufferedStrategy(std::size_t buffer_size_kb)
    : buffer_size_kb_(buffer_size_kb == 0 ? 1024 : buffer_size_kb) {}

auto BufferedStrategy::name() const -> std::string {
    return fmt::format("Buffered ({}KB)", buffer_size_kb_);
}

auto BufferedStrategy::description() const -> std::string {
    return fmt::format("Custom buffered copy with {}KB buffer size", buffer_size_kb_);
}

auto BufferedStrategy::copy_directory(const std::filesystem::path& src,
                                      const std::filesystem::path& dst,
                                      bool exclude_git,
                                      const CopyOptions& options) const -> CopyResult
{
    const auto buffer_size = buffer_size_kb_ * 1024;
    return copy_tree_sequential(src, dst, exclude_git, options, name(),
        [buffer_size](const std::filesystem::path& from, const std::filesystem::path& to) {
            return adapters::fs::copy_file_buffered(from, to, buffer_size);
        });
}

} // namespace dircopy::core
