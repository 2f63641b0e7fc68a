#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include "copy_strategy.hpp"
#include "../../infra/error_handler/error.hpp"

namespace dircopy::core {

using FileCopier = std::function<infra::Result<std::uint64_t>(const std::filesystem::path& src,
                                                              const std::filesystem::path& dst)>;

/// Общий проход Buffered/Sendfile: обход дерева, сначала все каталоги,
/// затем файлы по одному через copier. Первая ошибка прерывает вызов.
[[nodiscard]] auto copy_tree_sequential(const std::filesystem::path& src,
                                        const std::filesystem::path& dst,
                                        bool exclude_git,
                                        const CopyOptions& options,
                                        const std::string& strategy_name,
                                        const FileCopier& copier) -> CopyResult;

} // namespace dircopy::core
