#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace dircopy::core {

inline constexpr double kBytesPerMegabyte = 1024.0 * 1024.0;

// MB/s; 0 при нулевом или отрицательном времени
[[nodiscard]] inline auto megabytes_per_second(std::uint64_t bytes, double seconds) -> double {
    return seconds > 0.0 ? (static_cast<double>(bytes) / kBytesPerMegabyte) / seconds : 0.0;
}

/// Итог одного копирования каталога. Неизменяем после создания.
/// При неудаче bytes_copied отражает только выполненную до ошибки часть.
class CopyResult {
public:
    [[nodiscard]] static auto succeeded(std::uint64_t bytes_copied,
                                        double elapsed_time,
                                        std::string strategy_used) -> CopyResult {
        return CopyResult{true, bytes_copied, elapsed_time, std::nullopt, std::move(strategy_used)};
    }

    [[nodiscard]] static auto failed(std::string error,
                                     std::uint64_t bytes_copied,
                                     double elapsed_time,
                                     std::optional<std::string> strategy_used) -> CopyResult {
        return CopyResult{false, bytes_copied, elapsed_time, std::move(error), std::move(strategy_used)};
    }

    [[nodiscard]] auto success() const noexcept -> bool { return success_; }
    [[nodiscard]] auto bytes_copied() const noexcept -> std::uint64_t { return bytes_copied_; }
    [[nodiscard]] auto elapsed_time() const noexcept -> double { return elapsed_time_; }
    [[nodiscard]] auto error() const noexcept -> const std::optional<std::string>& { return error_; }
    [[nodiscard]] auto strategy_used() const noexcept -> const std::optional<std::string>& { return strategy_used_; }

    [[nodiscard]] auto speed_mbps() const noexcept -> double {
        return megabytes_per_second(bytes_copied_, elapsed_time_);
    }
    [[nodiscard]] auto speed_gbps() const noexcept -> double { return speed_mbps() / 1024.0; }

private:
    CopyResult(bool success, std::uint64_t bytes_copied, double elapsed_time,
               std::optional<std::string> error, std::optional<std::string> strategy_used)
        : success_(success)
        , bytes_copied_(bytes_copied)
        , elapsed_time_(elapsed_time)
        , error_(std::move(error))
        , strategy_used_(std::move(strategy_used))
    {}

    bool success_;
    std::uint64_t bytes_copied_;
    double elapsed_time_;
    std::optional<std::string> error_;
    std::optional<std::string> strategy_used_;
};

} // namespace dircopy::core
