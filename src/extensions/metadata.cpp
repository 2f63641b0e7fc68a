#include "metadata.hpp"
#include <string>
#include <system_error>
#include <fmt/core.h>

namespace dircopy::extensions {

auto copy_metadata(const std::filesystem::path& src,
                   const std::filesystem::path& dst)
    -> infra::VoidResult
{
    std::string failures;
    std::error_code ec;

    const auto mtime = std::filesystem::last_write_time(src, ec);
    if (!ec) {
        std::filesystem::last_write_time(dst, mtime, ec);
    }
    if (ec) {
        failures = fmt::format("mtime: {}", ec.message());
    }

#ifndef _WIN32
    ec.clear();
    const auto perms = std::filesystem::status(src, ec).permissions();
    if (!ec) {
        std::filesystem::permissions(dst, perms, std::filesystem::perm_options::replace, ec);
    }
    if (ec) {
        if (!failures.empty()) failures += "; ";
        failures += fmt::format("permissions: {}", ec.message());
    }
#endif

    if (!failures.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoFailure,
                               fmt::format("Metadata copy failed for {} ({})", dst.string(), failures)));
    }
    return {};
}

} // namespace dircopy::extensions
