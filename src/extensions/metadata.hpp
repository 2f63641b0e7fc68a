#pragma once

#include <filesystem>
#include "../infra/error_handler/error.hpp"

namespace dircopy::extensions {

/// Переносит mtime и права доступа с src на dst.
/// Обе части выполняются независимо; ошибка содержит все неудачи.
/// Вызывающий код трактует ошибку как предупреждение.
[[nodiscard]] auto copy_metadata(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
    -> infra::VoidResult;

} // namespace dircopy::extensions
