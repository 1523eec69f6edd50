// StageTimer Header
#pragma once
#include <chrono>

namespace pixelorigin::application {

/** @brief Wall-clock stopwatch for Server-Timing entries. */
class StageTimer {
public:
    StageTimer() : m_start(std::chrono::steady_clock::now()) {}

    void restart() { m_start = std::chrono::steady_clock::now(); }

    long long elapsedMs() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - m_start).count();
    }

private:
    std::chrono::steady_clock::time_point m_start;
};

} // namespace pixelorigin::application
