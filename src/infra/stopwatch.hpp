#pragma once

#include <chrono>

namespace dircopy::infra {

class Stopwatch {
public:
    Stopwatch() : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] auto elapsed_seconds() const -> double {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace dircopy::infra
