#include "traversal.hpp"

#include <cerrno>
#include <cstring>
#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#ifndef _WIN32
    #include <dirent.h>
    #include <fcntl.h>
    #include <sys/stat.h>
    #include <unistd.h>
#endif

namespace dircopy::adapters::traversal {

namespace {

// Каталоги на текущем пути спуска; повтор означает цикл через ссылку
struct DirId {
    std::uint64_t device = 0;
    std::uint64_t inode = 0;

    auto operator==(const DirId&) const -> bool = default;
};
using DescentPath = std::vector<DirId>;

auto on_path(const DescentPath& path, const std::optional<DirId>& id) -> bool {
    return id && std::find(path.begin(), path.end(), *id) != path.end();
}

auto dir_id(const std::filesystem::path& dir) -> std::optional<DirId> {
#ifndef _WIN32
    struct stat st{};
    if (::stat(dir.c_str(), &st) == -1) return std::nullopt;
    return DirId{static_cast<std::uint64_t>(st.st_dev), static_cast<std::uint64_t>(st.st_ino)};
#else
    (void)dir;
    return std::nullopt;
#endif
}

// Кладёт id на путь спуска на время жизни объекта
class DescentGuard {
public:
    DescentGuard(DescentPath& path, const std::optional<DirId>& id) : path_(path), pushed_(id.has_value()) {
        if (pushed_) path_.push_back(*id);
    }
    ~DescentGuard() {
        if (pushed_) path_.pop_back();
    }
    DescentGuard(const DescentGuard&) = delete;
    DescentGuard& operator=(const DescentGuard&) = delete;

private:
    DescentPath& path_;
    bool pushed_;
};

// =============== Portable ===============

auto stats_recursive_iterator(const std::filesystem::path& root) -> infra::Result<TraversalStats> {
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot open {}", root.string())));
    }

    TraversalStats stats;
    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (!it->is_regular_file(ec) || ec) continue;

        ++stats.file_count;
        const auto size = it->file_size(ec);
        if (!ec) stats.total_size += size;
    }
    if (ec) {
        spdlog::debug("Traversal of {} stopped early: {}", root.string(), ec.message());
    }
    return stats;
}

void stats_listing_level(const std::filesystem::path& dir, TraversalStats& stats, DescentPath& path) {
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            ++stats.file_count;
            const auto size = it->file_size(entry_ec);
            if (!entry_ec) stats.total_size += size;
        } else if (it->is_directory(entry_ec)) {
            const auto id = dir_id(it->path());
            if (on_path(path, id)) {
                spdlog::debug("Directory cycle at {}, not descending", it->path().string());
                continue;
            }
            DescentGuard guard(path, id);
            stats_listing_level(it->path(), stats, path);
        }
    }
}

auto stats_iterative_listing(const std::filesystem::path& root) -> infra::Result<TraversalStats> {
    std::error_code ec;
    std::filesystem::directory_iterator opened(root, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot open {}", root.string())));
    }

    TraversalStats stats;
    DescentPath path;
    DescentGuard guard(path, dir_id(root));
    stats_listing_level(root, stats, path);
    return stats;
}

void list_portable_level(const std::filesystem::path& root,
                         const std::filesystem::path& relative,
                         bool exclude_git, TreeListing& out, DescentPath& path)
{
    const auto dir = relative.empty() ? root : root / relative;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    for (std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename();
        if (exclude_git && name == ".git") continue;

        const auto rel = relative / name;
        std::error_code entry_ec;
        const auto st = it->status(entry_ec);
        if (entry_ec) {
            out.files.push_back(rel);
        } else if (std::filesystem::is_directory(st)) {
            const auto id = dir_id(it->path());
            if (on_path(path, id)) {
                // Ссылка на предка: копировать её как файл нельзя, стратегия сообщит об ошибке
                spdlog::debug("Directory cycle at {}", it->path().string());
                out.files.push_back(rel);
                continue;
            }
            out.directories.push_back(rel);
            DescentGuard guard(path, id);
            list_portable_level(root, rel, exclude_git, out, path);
        } else if (std::filesystem::is_regular_file(st)) {
            out.files.push_back(rel);
        } else {
            spdlog::debug("Skipping special file {}", it->path().string());
        }
    }
    if (ec) {
        out.unreadable.push_back(fmt::format("{}: {}", dir.string(), ec.message()));
    }
}

auto list_portable(const std::filesystem::path& root, bool exclude_git) -> infra::Result<TreeListing> {
    std::error_code ec;
    std::filesystem::directory_iterator opened(root, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot open {}", root.string())));
    }

    TreeListing out;
    DescentPath path;
    DescentGuard guard(path, dir_id(root));
    list_portable_level(root, {}, exclude_git, out, path);
    return out;
}

// =============== Dirent ===============
#ifndef _WIN32

struct DirCloser {
    void operator()(DIR* dir) const noexcept { ::closedir(dir); }
};
using DirHandle = std::unique_ptr<DIR, DirCloser>;

auto open_dir_at(int parent_fd, const char* name) -> DirHandle {
    const int fd = ::openat(parent_fd, name, O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd == -1) return nullptr;

    DIR* dir = ::fdopendir(fd);
    if (dir == nullptr) {
        const int err = errno;
        ::close(fd);
        errno = err;
        return nullptr;
    }
    return DirHandle{dir};
}

auto dir_id(DIR* dir) -> std::optional<DirId> {
    struct stat st{};
    if (::fstat(::dirfd(dir), &st) == -1) return std::nullopt;
    return DirId{static_cast<std::uint64_t>(st.st_dev), static_cast<std::uint64_t>(st.st_ino)};
}

auto is_dot_entry(const char* name) -> bool {
    return std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0;
}

enum class EntryKind { Directory, Regular, Special, Unresolved };

// d_type достаточно для каталогов и (без размера) обычных файлов;
// ссылки и DT_UNKNOWN разрешаются через fstatat
auto classify(DIR* dir, const dirent* entry, struct stat* st_out) -> EntryKind {
    switch (entry->d_type) {
        case DT_DIR:
            return EntryKind::Directory;
        case DT_REG:
            if (st_out == nullptr) return EntryKind::Regular;
            break;
        case DT_LNK:
        case DT_UNKNOWN:
            break;
        default:
            return EntryKind::Special;
    }

    struct stat st{};
    if (::fstatat(::dirfd(dir), entry->d_name, &st, 0) == -1) {
        return EntryKind::Unresolved;
    }
    if (st_out != nullptr) *st_out = st;
    if (S_ISDIR(st.st_mode)) return EntryKind::Directory;
    if (S_ISREG(st.st_mode)) return EntryKind::Regular;
    return EntryKind::Special;
}

void stats_dirent_level(DIR* dir, TraversalStats& stats, DescentPath& path) {
    while (const dirent* entry = ::readdir(dir)) {
        if (is_dot_entry(entry->d_name)) continue;

        struct stat st{};
        switch (classify(dir, entry, &st)) {
            case EntryKind::Directory:
                if (auto child = open_dir_at(::dirfd(dir), entry->d_name)) {
                    const auto id = dir_id(child.get());
                    if (on_path(path, id)) {
                        spdlog::debug("Directory cycle at {}, not descending", entry->d_name);
                        break;
                    }
                    DescentGuard guard(path, id);
                    stats_dirent_level(child.get(), stats, path);
                }
                break;
            case EntryKind::Regular:
                ++stats.file_count;
                stats.total_size += static_cast<std::uint64_t>(st.st_size);
                break;
            default:
                break;
        }
    }
}

auto stats_dirent(const std::filesystem::path& root) -> infra::Result<TraversalStats> {
    auto dir = open_dir_at(AT_FDCWD, root.c_str());
    if (!dir) {
        return std::unexpected(infra::from_errno(fmt::format("Cannot open {}", root.string())));
    }

    TraversalStats stats;
    DescentPath path;
    DescentGuard guard(path, dir_id(dir.get()));
    stats_dirent_level(dir.get(), stats, path);
    return stats;
}

void list_dirent_level(DIR* dir, const std::filesystem::path& relative,
                       bool exclude_git, TreeListing& out, DescentPath& path)
{
    while (const dirent* entry = ::readdir(dir)) {
        if (is_dot_entry(entry->d_name)) continue;
        if (exclude_git && std::strcmp(entry->d_name, ".git") == 0) continue;

        const auto rel = relative / entry->d_name;
        switch (classify(dir, entry, nullptr)) {
            case EntryKind::Directory: {
                auto child = open_dir_at(::dirfd(dir), entry->d_name);
                if (!child) {
                    const int err = errno;
                    out.directories.push_back(rel);
                    out.unreadable.push_back(fmt::format("{}: {}", rel.string(), std::strerror(err)));
                    break;
                }
                const auto id = dir_id(child.get());
                if (on_path(path, id)) {
                    // Ссылка на предка: копировать её как файл нельзя, стратегия сообщит об ошибке
                    spdlog::debug("Directory cycle at {}", rel.string());
                    out.files.push_back(rel);
                    break;
                }
                out.directories.push_back(rel);
                DescentGuard guard(path, id);
                list_dirent_level(child.get(), rel, exclude_git, out, path);
                break;
            }
            case EntryKind::Regular:
            case EntryKind::Unresolved:
                out.files.push_back(rel);
                break;
            case EntryKind::Special:
                spdlog::debug("Skipping special file {}", rel.string());
                break;
        }
    }
}

auto list_dirent(const std::filesystem::path& root, bool exclude_git) -> infra::Result<TreeListing> {
    auto dir = open_dir_at(AT_FDCWD, root.c_str());
    if (!dir) {
        return std::unexpected(infra::from_errno(fmt::format("Cannot open {}", root.string())));
    }

    TreeListing out;
    DescentPath path;
    DescentGuard guard(path, dir_id(dir.get()));
    list_dirent_level(dir.get(), {}, exclude_git, out, path);
    return out;
}

#endif

} // namespace

auto method_name(Method method) -> std::string_view {
    switch (method) {
        case Method::RecursiveIterator: return "recursive_iterator";
        case Method::IterativeListing:  return "iterative_listing";
        case Method::Dirent:            return "dirent";
    }
    return "unknown";
}

auto native_enumeration_available() -> bool {
#ifndef _WIN32
    return true;
#else
    return false;
#endif
}

auto available_methods() -> std::vector<Method> {
    std::vector<Method> methods;
    if (native_enumeration_available()) {
        methods.push_back(Method::Dirent);
    }
    methods.push_back(Method::IterativeListing);
    methods.push_back(Method::RecursiveIterator);
    return methods;
}

auto collect_stats(const std::filesystem::path& root, Method method) -> infra::Result<TraversalStats> {
    switch (method) {
        case Method::RecursiveIterator:
            return stats_recursive_iterator(root);
        case Method::IterativeListing:
            return stats_iterative_listing(root);
        case Method::Dirent:
#ifndef _WIN32
            return stats_dirent(root);
#else
            break;
#endif
    }
    return std::unexpected(infra::make_error(infra::ErrorCode::UnsupportedFeature,
                           fmt::format("Traversal method '{}' is not available", method_name(method))));
}

auto fast_directory_stats(const std::filesystem::path& root) -> TraversalStats {
    const auto method = native_enumeration_available() ? Method::Dirent : Method::IterativeListing;
    auto stats = collect_stats(root, method);
    if (!stats) {
        spdlog::debug("Cannot size {}: {}", root.string(), stats.error().message);
        return {};
    }
    return *stats;
}

auto list_tree(const std::filesystem::path& root, bool exclude_git, bool prefer_native)
    -> infra::Result<TreeListing>
{
#ifndef _WIN32
    if (prefer_native) {
        auto listing = list_dirent(root, exclude_git);
        if (listing) {
            return listing;
        }
        spdlog::debug("Native enumeration failed ({}), using portable listing", listing.error().message);
    }
#else
    (void)prefer_native;
#endif
    return list_portable(root, exclude_git);
}

} // namespace dircopy::adapters::traversal
