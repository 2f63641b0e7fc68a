#include "fs.hpp"
#include "traversal.hpp"

#include <algorithm>
#include <cerrno>
#include <system_error>
#include <memory>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#ifdef __linux__
    #include <sys/sendfile.h>
#endif

namespace dircopy::adapters::fs {

namespace {

// Владеет POSIX-дескриптором
class FileDescriptor {
public:
    explicit FileDescriptor(int fd = -1) noexcept : fd_(fd) {}
    ~FileDescriptor() { if (fd_ >= 0) ::close(fd_); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            if (fd_ >= 0) ::close(fd_);
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] auto valid() const noexcept -> bool { return fd_ >= 0; }

    // Явное закрытие: у приёмника ошибка close() означает потерю данных
    auto close() noexcept -> int {
        const int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

struct OpenedPair {
    FileDescriptor in;
    FileDescriptor out;
    struct stat source_stat{};
};

auto open_pair(const std::filesystem::path& src, const std::filesystem::path& dst)
    -> infra::Result<OpenedPair>
{
    OpenedPair pair{FileDescriptor{::open(src.c_str(), O_RDONLY | O_CLOEXEC)}, FileDescriptor{}};
    if (!pair.in.valid()) {
        return std::unexpected(infra::from_errno(fmt::format("Cannot open source {}", src.string())));
    }
    if (::fstat(pair.in.get(), &pair.source_stat) == -1) {
        return std::unexpected(infra::from_errno(fmt::format("fstat failed for {}", src.string())));
    }
    if (!S_ISREG(pair.source_stat.st_mode)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                               fmt::format("Not a regular file: {}", src.string())));
    }

    const mode_t mode = pair.source_stat.st_mode & 0777;
    pair.out = FileDescriptor{::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode)};
    if (!pair.out.valid()) {
        return std::unexpected(infra::from_errno(fmt::format("Cannot create destination {}", dst.string())));
    }
    return pair;
}

auto write_all(int fd, const char* data, std::size_t size) -> bool {
    while (size > 0) {
        const ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return true;
}

constexpr std::size_t kMinBufferSize = 4096;

// Буфер не больше файла: мелкие файлы не платят за полный buffer_size
auto buffer_size_for(std::size_t buffer_size, const struct stat& source) -> std::size_t {
    const auto file_size = static_cast<std::uint64_t>(std::max<off_t>(source.st_size, 0));
    // +1, чтобы первый же read увидел EOF
    const auto wanted = std::min<std::uint64_t>(buffer_size, file_size + 1);
    return std::max<std::size_t>(static_cast<std::size_t>(wanted), kMinBufferSize);
}

auto copy_fd_buffered(int in, int out, std::size_t buffer_size,
                      const std::filesystem::path& src, const std::filesystem::path& dst)
    -> infra::Result<std::uint64_t>
{
    const auto buffer = std::make_unique_for_overwrite<char[]>(buffer_size);
    std::uint64_t total = 0;

    for (;;) {
        const ssize_t n = ::read(in, buffer.get(), buffer_size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::from_errno(fmt::format("Read error in {}", src.string())));
        }
        if (n == 0) break;

        if (!write_all(out, buffer.get(), static_cast<std::size_t>(n))) {
            return std::unexpected(infra::from_errno(fmt::format("Write error in {}", dst.string())));
        }
        total += static_cast<std::uint64_t>(n);
    }
    return total;
}

auto finish(OpenedPair& pair, const std::filesystem::path& dst, std::uint64_t copied)
    -> infra::Result<std::uint64_t>
{
    if (pair.out.close() != 0) {
        return std::unexpected(infra::from_errno(fmt::format("Close failed for {}", dst.string())));
    }
    return copied;
}

#ifdef __linux__
// sendfile(2) передаёт не более 0x7ffff000 байт за вызов
constexpr std::size_t kMaxSendfileChunk = 0x7ffff000;

ssize_t system_sendfile(int out_fd, int in_fd, off_t* offset, std::size_t count) {
    return ::sendfile(out_fd, in_fd, offset, count);
}
#endif

} // namespace

auto is_git_path(const std::filesystem::path& relative) -> bool {
    return std::any_of(relative.begin(), relative.end(),
                       [](const std::filesystem::path& part) { return part == ".git"; });
}

auto require_directory(const std::filesystem::path& dir) -> infra::VoidResult {
    std::error_code ec;
    const auto st = std::filesystem::status(dir, ec);
    if (st.type() == std::filesystem::file_type::not_found) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
                               fmt::format("Source directory does not exist: {}", dir.string())));
    }
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot stat {}", dir.string())));
    }
    if (!std::filesystem::is_directory(st)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NotADirectory,
                               fmt::format("Source is not a directory: {}", dir.string())));
    }
    return {};
}

auto remove_tree(const std::filesystem::path& dir) -> infra::VoidResult {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::symlink_status(dir, ec))) {
        return {};
    }
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot remove {}", dir.string())));
    }
    return {};
}

auto directory_size(const std::filesystem::path& dir) -> std::uint64_t {
    return traversal::fast_directory_stats(dir).total_size;
}

auto count_files(const std::filesystem::path& dir) -> std::uint64_t {
    return traversal::fast_directory_stats(dir).file_count;
}

auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t buffer_size
) -> infra::Result<std::uint64_t> {
    auto pair = open_pair(src, dst);
    if (!pair) {
        return std::unexpected(std::move(pair.error()));
    }

    auto copied = copy_fd_buffered(pair->in.get(), pair->out.get(),
                                   buffer_size_for(buffer_size, pair->source_stat), src, dst);
    if (!copied) {
        return copied;
    }
    return finish(*pair, dst, *copied);
}

auto sendfile_supported() -> bool {
#ifdef __linux__
    return true;
#else
    return false;
#endif
}

auto copy_file_sendfile(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t fallback_buffer_size,
    SendfileCall call
) -> infra::Result<std::uint64_t> {
#ifdef __linux__
    if (call == nullptr) {
        call = &system_sendfile;
    }

    auto pair = open_pair(src, dst);
    if (!pair) {
        return std::unexpected(std::move(pair.error()));
    }

    const auto file_size = static_cast<std::uint64_t>(pair->source_stat.st_size);
    off_t offset = 0;

    while (static_cast<std::uint64_t>(offset) < file_size) {
        const auto remaining = file_size - static_cast<std::uint64_t>(offset);
        const auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, kMaxSendfileChunk));
        const ssize_t sent = call(pair->out.get(), pair->in.get(), &offset, chunk);
        if (sent > 0) continue;
        if (sent == 0) break; // файл укоротился во время копирования
        const int err = errno;
        if (err == EINTR) continue;

        spdlog::debug("sendfile failed for {} ({}), falling back to buffered copy",
                      src.string(), std::error_code(err, std::generic_category()).message());

        // Перематываем и копируем этот файл заново
        if (::lseek(pair->in.get(), 0, SEEK_SET) == -1 ||
            ::ftruncate(pair->out.get(), 0) == -1 ||
            ::lseek(pair->out.get(), 0, SEEK_SET) == -1) {
            return std::unexpected(infra::from_errno(
                fmt::format("Cannot rewind after sendfile failure on {}", src.string())));
        }

        auto copied = copy_fd_buffered(pair->in.get(), pair->out.get(),
                                       buffer_size_for(fallback_buffer_size, pair->source_stat), src, dst);
        if (!copied) {
            return copied;
        }
        return finish(*pair, dst, *copied);
    }

    return finish(*pair, dst, static_cast<std::uint64_t>(offset));
#else
    (void)src; (void)dst; (void)fallback_buffer_size; (void)call;
    return std::unexpected(infra::make_error(infra::ErrorCode::UnsupportedFeature,
                           "sendfile system call not available"));
#endif
}

auto copy_single_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::Result<std::uint64_t> {
    std::error_code ec;
    std::filesystem::copy_file(src, dst, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot copy {}", src.string())));
    }

    const auto size = std::filesystem::file_size(dst, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot stat {}", dst.string())));
    }

    // mtime как у copy2; ошибка не критична
    const auto mtime = std::filesystem::last_write_time(src, ec);
    if (!ec) {
        std::filesystem::last_write_time(dst, mtime, ec);
    }
    if (ec) {
        spdlog::debug("Cannot preserve mtime of {}: {}", dst.string(), ec.message());
    }
    return size;
}

namespace {

auto copy_tree_level(
    const std::filesystem::path& src_dir,
    const std::filesystem::path& dst_dir,
    bool exclude_git,
    std::uint64_t& bytes_copied
) -> infra::VoidResult {
    std::error_code ec;
    std::filesystem::directory_iterator it(src_dir, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot list {}", src_dir.string())));
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot list {}", src_dir.string())));
        }

        const auto& entry = *it;
        const auto name = entry.path().filename();
        if (exclude_git && is_git_path(name)) {
            continue;
        }

        const auto target = dst_dir / name;
        const auto st = entry.status(ec);
        if (ec) {
            return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot stat {}", entry.path().string())));
        }

        if (std::filesystem::is_directory(st)) {
            std::filesystem::create_directory(target, ec);
            if (ec) {
                return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot create {}", target.string())));
            }
            if (auto res = copy_tree_level(entry.path(), target, exclude_git, bytes_copied); !res) {
                return res;
            }
        } else if (std::filesystem::is_regular_file(st)) {
            auto copied = copy_single_file(entry.path(), target);
            if (!copied) {
                return std::unexpected(std::move(copied.error()));
            }
            bytes_copied += *copied;
        } else {
            spdlog::debug("Skipping special file {}", entry.path().string());
        }
    }
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot list {}", src_dir.string())));
    }

    // Права и mtime каталога после заполнения, как copystat
    const auto perms = std::filesystem::status(src_dir, ec).permissions();
    if (!ec) {
        std::filesystem::permissions(dst_dir, perms, ec);
    }
    const auto mtime = std::filesystem::last_write_time(src_dir, ec);
    if (!ec) {
        std::filesystem::last_write_time(dst_dir, mtime, ec);
    }
    return {};
}

} // namespace

auto copy_tree(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    bool exclude_git,
    std::uint64_t& bytes_copied
) -> infra::VoidResult {
    if (auto res = require_directory(src); !res) {
        return res;
    }

    std::error_code ec;
    std::filesystem::create_directories(dst, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot create {}", dst.string())));
    }
    return copy_tree_level(src, dst, exclude_git, bytes_copied);
}

} // namespace dircopy::adapters::fs
