#include "copy_service.hpp"

#include <algorithm>
#include <utility>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "../strategies/baseline_strategy.hpp"
#include "../strategies/buffered_strategy.hpp"
#include "../strategies/parallel_strategy.hpp"
#include "../strategies/pipeline_strategy.hpp"
#include "../strategies/sendfile_strategy.hpp"

namespace dircopy::core {

namespace {

template<typename T>
auto positive_or(const std::optional<std::int64_t>& value, T fallback, T upper) -> T {
    if (!value || *value <= 0) return fallback;
    return static_cast<T>(std::min<std::int64_t>(*value, static_cast<std::int64_t>(upper)));
}

} // namespace

auto CopyServiceSettings::from_config(const infra::Config& config) -> CopyServiceSettings {
    CopyServiceSettings settings;

    if (config.copy_strategy) {
        if (auto kind = parse_strategy_kind(*config.copy_strategy)) {
            settings.default_strategy = *kind;
        } else {
            spdlog::warn("Unknown copy_strategy '{}', using baseline", *config.copy_strategy);
        }
    }

    settings.buffer_size_kb = positive_or<std::size_t>(config.copy_buffer_size_kb, 1024, kMaxBufferSizeKb);
    settings.max_workers = positive_or<std::uint32_t>(config.copy_max_workers, 4, kMaxWorkers);
    settings.pipeline_copy_workers = positive_or<std::uint32_t>(config.pipeline_copy_workers, 3, kMaxWorkers);
    settings.pipeline_size_workers = positive_or<std::uint32_t>(config.pipeline_size_workers, 4, kMaxWorkers);
    return settings;
}

auto make_default_strategies(const CopyServiceSettings& settings) -> StrategyMap {
    StrategyMap strategies;
    strategies.emplace(CopyStrategyKind::Baseline, std::make_unique<BaselineStrategy>());
    strategies.emplace(CopyStrategyKind::Buffered, std::make_unique<BufferedStrategy>(settings.buffer_size_kb));
    strategies.emplace(CopyStrategyKind::Parallel,
                       std::make_unique<ParallelStrategy>(settings.max_workers, settings.buffer_size_kb));
    strategies.emplace(CopyStrategyKind::Pipeline,
                       std::make_unique<PipelineStrategy>(settings.pipeline_copy_workers,
                                                          settings.pipeline_size_workers));

    auto sendfile = std::make_unique<SendfileStrategy>(settings.buffer_size_kb);
    if (const auto missing = sendfile->validate_prerequisites(); missing.empty()) {
        strategies.emplace(CopyStrategyKind::Sendfile, std::move(sendfile));
    } else {
        spdlog::debug("Sendfile strategy not registered: {}", fmt::join(missing, "; "));
    }
    return strategies;
}

CopyService::CopyService(CopyServiceSettings settings)
    : settings_(settings)
    , strategies_(make_default_strategies(settings_))
{}

CopyService::CopyService(CopyServiceSettings settings, StrategyMap strategies)
    : settings_(settings)
{
    for (auto& [kind, strategy] : strategies) {
        if (!strategy) continue;
        if (const auto missing = strategy->validate_prerequisites(); !missing.empty()) {
            spdlog::debug("{} strategy not registered: {}", to_string(kind), fmt::join(missing, "; "));
            continue;
        }
        strategies_.emplace(kind, std::move(strategy));
    }
    // Откат всегда возможен
    if (!strategies_.contains(CopyStrategyKind::Baseline)) {
        strategies_.emplace(CopyStrategyKind::Baseline, std::make_unique<BaselineStrategy>());
    }
}

auto CopyService::resolve(CopyStrategyKind requested) const -> const CopyStrategy& {
    const auto& baseline = *strategies_.at(CopyStrategyKind::Baseline);

    const auto it = strategies_.find(requested);
    if (it == strategies_.end()) {
        spdlog::warn("Strategy '{}' is not available, falling back to Baseline", to_string(requested));
        return baseline;
    }

    // Возможности хоста могли измениться после конструирования
    if (const auto missing = it->second->validate_prerequisites(); !missing.empty()) {
        spdlog::warn("Strategy '{}' prerequisites not met ({}), falling back to Baseline",
                     to_string(requested), fmt::join(missing, "; "));
        return baseline;
    }
    return *it->second;
}

auto CopyService::copy_directory(const std::filesystem::path& src,
                                 const std::filesystem::path& dst,
                                 bool exclude_git,
                                 std::optional<CopyStrategyKind> strategy_override,
                                 const CopyOptions& options) const -> CopyResult
{
    const auto requested = strategy_override.value_or(settings_.default_strategy);
    const auto& strategy = resolve(requested);

    spdlog::debug("Using {} strategy: {} -> {}", strategy.name(), src.string(), dst.string());
    return strategy.copy_directory(src, dst, exclude_git, options);
}

auto CopyService::list_available_strategies() const -> std::vector<CopyStrategyKind> {
    std::vector<CopyStrategyKind> kinds;
    kinds.reserve(strategies_.size());
    for (const auto& [kind, strategy] : strategies_) {
        kinds.push_back(kind);
    }
    return kinds;
}

auto CopyService::get_strategy_info(CopyStrategyKind kind) const -> std::optional<StrategyInfo> {
    const auto it = strategies_.find(kind);
    if (it == strategies_.end()) {
        return std::nullopt;
    }

    auto missing = it->second->validate_prerequisites();
    const bool available = missing.empty();
    return StrategyInfo{
        .kind = kind,
        .name = it->second->name(),
        .description = it->second->description(),
        .missing_prerequisites = std::move(missing),
        .available = available,
    };
}

auto create_copy_service(const infra::Config* config) -> CopyService {
    if (config == nullptr) {
        return CopyService{};
    }
    return CopyService{CopyServiceSettings::from_config(*config)};
}

} // namespace dircopy::core
