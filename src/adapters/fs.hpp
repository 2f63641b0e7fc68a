#pragma once

#include <filesystem>
#include <cstddef>
#include <cstdint>
#include <sys/types.h>
#include "../infra/error_handler/error.hpp"

namespace dircopy::adapters::fs {

inline constexpr std::size_t kDefaultBufferSize = 1024 * 1024;

// true, если какой-либо компонент относительного пути равен ".git"
[[nodiscard]] auto is_git_path(const std::filesystem::path& relative) -> bool;

// Источник существует и является каталогом
[[nodiscard]] auto require_directory(const std::filesystem::path& dir) -> infra::VoidResult;

// Удаляет каталог целиком; отсутствие каталога не ошибка
[[nodiscard]] auto remove_tree(const std::filesystem::path& dir) -> infra::VoidResult;

// Суммарный размер и число обычных файлов поддерева; 0 для нечитаемого
[[nodiscard]] auto directory_size(const std::filesystem::path& dir) -> std::uint64_t;
[[nodiscard]] auto count_files(const std::filesystem::path& dir) -> std::uint64_t;

// =============== Buffered I/O ===============
// read/write цикл с буфером фиксированного размера. Возвращает число байт.
[[nodiscard]] auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t buffer_size = kDefaultBufferSize
) -> infra::Result<std::uint64_t>;

// =============== Zero-copy (sendfile) ===============
using SendfileCall = ssize_t (*)(int out_fd, int in_fd, off_t* offset, std::size_t count);

[[nodiscard]] auto sendfile_supported() -> bool;

// Любая ошибка sendfile для конкретного файла: перемотка обоих дескрипторов,
// усечение приёмника и докопирование этого файла буферизованным циклом.
[[nodiscard]] auto copy_file_sendfile(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t fallback_buffer_size = kDefaultBufferSize,
    SendfileCall call = nullptr
) -> infra::Result<std::uint64_t>;

// =============== Native tree copy ===============
// std::filesystem::copy_file + mtime. Размер скопированного файла.
[[nodiscard]] auto copy_single_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::Result<std::uint64_t>;

// Рекурсивное копирование дерева; ".git" пропускается на любой глубине при
// exclude_git. Прерывается на первой ошибке, bytes_copied отражает уже
// скопированное.
[[nodiscard]] auto copy_tree(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    bool exclude_git,
    std::uint64_t& bytes_copied
) -> infra::VoidResult;

} // namespace dircopy::adapters::fs
