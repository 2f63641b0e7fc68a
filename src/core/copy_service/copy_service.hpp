#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../models/copy_result.hpp"
#include "../strategies/copy_strategy.hpp"
#include "../strategies/strategy_kind.hpp"
#include "../../infra/config/config.hpp"

namespace dircopy::core {

inline constexpr std::size_t kMaxBufferSizeKb = 1024 * 1024; // 1 GiB
inline constexpr std::uint32_t kMaxWorkers = 256;

/// Проверенные настройки сервиса. Значения по умолчанию подставляются
/// здесь и только здесь.
struct CopyServiceSettings {
    CopyStrategyKind default_strategy = CopyStrategyKind::Baseline;
    std::size_t buffer_size_kb = 1024;
    std::uint32_t max_workers = 4;
    std::uint32_t pipeline_copy_workers = 3;
    std::uint32_t pipeline_size_workers = 4;

    [[nodiscard]] static auto from_config(const infra::Config& config) -> CopyServiceSettings;
};

struct StrategyInfo {
    CopyStrategyKind kind;
    std::string name;
    std::string description;
    std::vector<std::string> missing_prerequisites;
    bool available = false;
};

using StrategyMap = std::map<CopyStrategyKind, std::unique_ptr<CopyStrategy>>;

// Реестр по умолчанию: Sendfile только если доступен на хосте
[[nodiscard]] auto make_default_strategies(const CopyServiceSettings& settings) -> StrategyMap;

/// Единая точка входа: выбор стратегии, проверка предпосылок и откат
/// на Baseline. Реестр строится один раз и дальше не меняется.
class CopyService {
public:
    explicit CopyService(CopyServiceSettings settings = {});

    // Явный реестр. Baseline добавляется, если отсутствует; стратегии
    // с невыполненными предпосылками не регистрируются.
    CopyService(CopyServiceSettings settings, StrategyMap strategies);

    CopyService(const CopyService&) = delete;
    CopyService& operator=(const CopyService&) = delete;
    CopyService(CopyService&&) = default;
    CopyService& operator=(CopyService&&) = default;

    [[nodiscard]] auto copy_directory(const std::filesystem::path& src,
                                      const std::filesystem::path& dst,
                                      bool exclude_git = false,
                                      std::optional<CopyStrategyKind> strategy_override = std::nullopt,
                                      const CopyOptions& options = {}) const -> CopyResult;

    [[nodiscard]] auto list_available_strategies() const -> std::vector<CopyStrategyKind>;
    [[nodiscard]] auto get_strategy_info(CopyStrategyKind kind) const -> std::optional<StrategyInfo>;

    [[nodiscard]] auto default_strategy() const noexcept -> CopyStrategyKind { return settings_.default_strategy; }
    [[nodiscard]] auto settings() const noexcept -> const CopyServiceSettings& { return settings_; }

private:
    [[nodiscard]] auto resolve(CopyStrategyKind requested) const -> const CopyStrategy&;

    CopyServiceSettings settings_;
    StrategyMap strategies_;
};

// nullptr -> настройки по умолчанию
[[nodiscard]] auto create_copy_service(const infra::Config* config = nullptr) -> CopyService;

} // namespace dircopy::core
