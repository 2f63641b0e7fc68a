#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "../models/copy_result.hpp"

namespace dircopy::core {

// Параметры одного вызова copy_directory
struct CopyOptions {
    bool preserve_metadata = true; // mtime и права, best-effort
};

/// Общий контракт стратегий копирования дерева.
///
/// copy_directory копирует всё содержимое src в dst, предварительно удаляя dst.
/// При exclude_git пропускается любой компонент пути с именем ".git".
/// Ожидаемые ошибки ввода-вывода возвращаются неуспешным CopyResult,
/// исключения наружу не выходят.
class CopyStrategy {
public:
    virtual ~CopyStrategy() = default;

    [[nodiscard]] virtual auto name() const -> std::string = 0;
    [[nodiscard]] virtual auto description() const -> std::string = 0;

    // Пустой список — стратегия может работать на этом хосте
    [[nodiscard]] virtual auto validate_prerequisites() const -> std::vector<std::string> = 0;

    [[nodiscard]] virtual auto copy_directory(const std::filesystem::path& src,
                                              const std::filesystem::path& dst,
                                              bool exclude_git,
                                              const CopyOptions& options) const -> CopyResult = 0;
};

} // namespace dircopy::core
