#pragma once

#include <cstddef>
#include "copy_strategy.hpp"

namespace dircopy::core {

/// Ручной обход: сначала каталоги, затем read/write цикл с буфером
/// фиксированного размера для каждого файла.
class BufferedStrategy final : public CopyStrategy {
public:
    explicit BufferedStrategy(std::size_t buffer_size_kb = 1024);

    [[nodiscard]] auto name() const -> std::string override;
    [[nodiscard]] auto description() const -> std::string override;
    [[nodiscard]] auto validate_prerequisites() const -> std::vector<std::string> override { return {}; }

    [[nodiscard]] auto copy_directory(const std::filesystem::path& src,
                                      const std::filesystem::path& dst,
                                      bool exclude_git,
                                      const CopyOptions& options) const -> CopyResult override;

    [[nodiscard]] auto buffer_size_kb() const noexcept -> std::size_t { return buffer_size_kb_; }

private:
    std::size_t buffer_size_kb_;
};

} // namespace dircopy::core
