#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace dircopy::core {

enum class CopyStrategyKind {
    Baseline,
    Buffered,
    Sendfile,
    Parallel,
    Pipeline,
};

inline constexpr std::array kAllStrategyKinds{
    CopyStrategyKind::Baseline,
    CopyStrategyKind::Buffered,
    CopyStrategyKind::Sendfile,
    CopyStrategyKind::Parallel,
    CopyStrategyKind::Pipeline,
};

// Идентификатор для конфигурации и CLI: "baseline", "buffered", ...
[[nodiscard]] constexpr auto to_string(CopyStrategyKind kind) -> std::string_view {
    switch (kind) {
        case CopyStrategyKind::Baseline: return "baseline";
        case CopyStrategyKind::Buffered: return "buffered";
        case CopyStrategyKind::Sendfile: return "sendfile";
        case CopyStrategyKind::Parallel: return "parallel";
        case CopyStrategyKind::Pipeline: return "pipeline";
    }
    return "baseline";
}

[[nodiscard]] constexpr auto parse_strategy_kind(std::string_view value) -> std::optional<CopyStrategyKind> {
    for (const auto kind : kAllStrategyKinds) {
        if (to_string(kind) == value) return kind;
    }
    return std::nullopt;
}

} // namespace dircopy::core
