#pragma once

#include <cstddef>
#include <cstdint>
#include "copy_strategy.hpp"

namespace dircopy::core {

/// Два прохода: обход и разбиение на каталоги/файлы, создание всех каталогов,
/// затем каждый файл отдельной задачей на пуле из max_workers потоков.
/// Неудача отдельного файла — warning, вызов в целом успешен.
class ParallelStrategy final : public CopyStrategy {
public:
    explicit ParallelStrategy(std::uint32_t max_workers = 4, std::size_t buffer_size_kb = 1024);

    [[nodiscard]] auto name() const -> std::string override;
    [[nodiscard]] auto description() const -> std::string override;
    [[nodiscard]] auto validate_prerequisites() const -> std::vector<std::string> override { return {}; }

    [[nodiscard]] auto copy_directory(const std::filesystem::path& src,
                                      const std::filesystem::path& dst,
                                      bool exclude_git,
                                      const CopyOptions& options) const -> CopyResult override;

    [[nodiscard]] auto max_workers() const noexcept -> std::uint32_t { return max_workers_; }
    [[nodiscard]] auto buffer_size_kb() const noexcept -> std::size_t { return buffer_size_kb_; }

private:
    std::uint32_t max_workers_;
    std::size_t buffer_size_kb_;
};

} // namespace dircopy::core
