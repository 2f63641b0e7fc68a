#pragma once

#include "copy_strategy.hpp"

namespace dircopy::core {

/// std::filesystem-копирование дерева с фильтром ".git".
/// Не требует ничего от хоста; цель отката для остальных стратегий.
class BaselineStrategy final : public CopyStrategy {
public:
    [[nodiscard]] auto name() const -> std::string override { return "Baseline"; }
    [[nodiscard]] auto description() const -> std::string override;
    [[nodiscard]] auto validate_prerequisites() const -> std::vector<std::string> override { return {}; }

    [[nodiscard]] auto copy_directory(const std::filesystem::path& src,
                                      const std::filesystem::path& dst,
                                      bool exclude_git,
                                      const CopyOptions& options) const -> CopyResult override;
};

} // namespace dircopy::core
