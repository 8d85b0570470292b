#pragma once

#include <chrono>
#include <cstdio>
#include <string>

namespace SixDegrees {

/**
 * @brief Steady-clock stopwatch used for stage and pipeline timings.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

    /**
     * @brief Human-readable elapsed time: "850ms", "12.4s", "3m 07s".
     */
    std::string format() const {
        return format_seconds(elapsed_sec());
    }

    static std::string format_seconds(double seconds) {
        char buf[32];
        if (seconds < 1.0) {
            std::snprintf(buf, sizeof(buf), "%.0fms", seconds * 1000.0);
        } else if (seconds < 60.0) {
            std::snprintf(buf, sizeof(buf), "%.1fs", seconds);
        } else {
            long total = static_cast<long>(seconds);
            std::snprintf(buf, sizeof(buf), "%ldm %02lds", total / 60, total % 60);
        }
        return buf;
    }

private:
    TimePoint start_;
};

} // namespace SixDegrees
