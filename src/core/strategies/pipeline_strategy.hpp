#pragma once

#include <cstdint>
#include "copy_strategy.hpp"

namespace dircopy::core {

/// Двухфазное копирование на уровне компонентов (подкаталоги верхнего уровня
/// и файлы в корне): размеры на пуле size_workers, копирование на пуле
/// copy_workers. Без компонентов — обычное копирование, к имени
/// добавляется " (fallback)".
class PipelineStrategy final : public CopyStrategy {
public:
    explicit PipelineStrategy(std::uint32_t copy_workers = 3, std::uint32_t size_workers = 4);

    [[nodiscard]] auto name() const -> std::string override;
    [[nodiscard]] auto description() const -> std::string override;
    [[nodiscard]] auto validate_prerequisites() const -> std::vector<std::string> override { return {}; }

    [[nodiscard]] auto copy_directory(const std::filesystem::path& src,
                                      const std::filesystem::path& dst,
                                      bool exclude_git,
                                      const CopyOptions& options) const -> CopyResult override;

private:
    [[nodiscard]] auto fallback_copy(const std::filesystem::path& src,
                                     const std::filesystem::path& dst,
                                     bool exclude_git,
                                     double elapsed_before) const -> CopyResult;

    std::uint32_t copy_workers_;
    std::uint32_t size_workers_;
};

} // namespace dircopy::core
