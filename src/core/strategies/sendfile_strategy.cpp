#include "sendfile_strategy.hpp"

#include <spdlog/spdlog.h>
#include "sequential_copy.hpp"

namespace dircopy::core {

SendfileStrategy::SendfileStrategy(std::size_t fallback_buffer_size_kb,
                                   CapabilityProbe probe,
                                   adapters::fs::SendfileCall call)
    : fallback_buffer_size_kb_(fallback_buffer_size_kb == 0 ? 1024 : fallback_buffer_size_kb)
    , probe_(probe)
    , call_(call)
{}

auto SendfileStrategy::description() const -> std::string {
    return "Copy using the sendfile system call (Linux only)";
}

auto SendfileStrategy::validate_prerequisites() const -> std::vector<std::string> {
    if (probe_ == nullptr || !probe_()) {
        return {"sendfile system call not available"};
    }
    return {};
}

auto SendfileStrategy::copy_directory(const std::filesystem::path& src,
                                      const std::filesystem::path& dst,
                                      bool exclude_git,
                                      const CopyOptions& options) const -> CopyResult
{
    if (auto missing = validate_prerequisites(); !missing.empty()) {
        spdlog::error("Sendfile copy failed: {}", missing.front());
        return CopyResult::failed(missing.front(), 0, 0.0, name());
    }

    const auto buffer_size = fallback_buffer_size_kb_ * 1024;
    const auto call = call_;
    return copy_tree_sequential(src, dst, exclude_git, options, name(),
        [buffer_size, call](const std::filesystem::path& from, const std::filesystem::path& to) {
            return adapters::fs::copy_file_sendfile(from, to, buffer_size, call);
        });
}

} // namespace dircopy::core
