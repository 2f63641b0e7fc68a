#pragma once

#include <filesystem>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "../infra/error_handler/error.hpp"

namespace dircopy::adapters::traversal {

enum class Method {
    RecursiveIterator,  // std::filesystem::recursive_directory_iterator
    IterativeListing,   // ручная рекурсия по directory_iterator
    Dirent,             // openat/fdopendir/readdir + d_type (POSIX)
};

struct TraversalStats {
    std::uint64_t file_count = 0;
    std::uint64_t total_size = 0;
};

// Пути относительно корня обхода
struct TreeListing {
    std::vector<std::filesystem::path> directories;
    std::vector<std::filesystem::path> files;
    std::vector<std::string> unreadable; // подкаталоги, которые не удалось прочитать
};

[[nodiscard]] auto method_name(Method method) -> std::string_view;

[[nodiscard]] auto native_enumeration_available() -> bool;

// Переносимые методы всегда, Dirent только там, где он есть
[[nodiscard]] auto available_methods() -> std::vector<Method>;

// Число и суммарный размер обычных файлов. Ошибка только если корень
// не читается; ошибки отдельных записей пропускаются.
[[nodiscard]] auto collect_stats(const std::filesystem::path& root, Method method)
    -> infra::Result<TraversalStats>;

// Самый быстрый доступный метод; нули, если каталог не читается
[[nodiscard]] auto fast_directory_stats(const std::filesystem::path& root) -> TraversalStats;

// Разбивает дерево на каталоги и файлы (с учётом ".git" при exclude_git).
// prefer_native: сначала Dirent, при ошибке переносимый обход.
// Записи, тип которых не определить (битые ссылки), попадают в files:
// ошибка проявится при копировании.
[[nodiscard]] auto list_tree(const std::filesystem::path& root, bool exclude_git, bool prefer_native)
    -> infra::Result<TreeListing>;

} // namespace dircopy::adapters::traversal
