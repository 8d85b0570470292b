#pragma once

#include <export.hpp>
#include <cstddef>
#include <string>

namespace SixDegrees {

/**
 * @brief Thread-safe console logger for the loaders, stages and tools.
 *
 * Warnings and errors go to stderr so that tools writing machine-readable
 * output (sixdegrees_path --json) keep stdout clean.
 */
class SIXDEGREES_API Logger {
public:
    enum class Level {
        Info,
        Step,
        Success,
        Warning,
        Error,
        Bulk
    };

    static void log(Level level, const std::string& message);

    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }
    static void bulk(const std::string& msg)    { log(Level::Bulk, msg); }

    /**
     * @brief Suppress everything below Warning (used by --json output).
     */
    static void set_quiet(bool quiet_mode) { quiet() = quiet_mode; }

    /**
     * @brief Format a row count with thousands separators: 1234567 -> "1,234,567".
     */
    static std::string count(size_t n) {
        std::string digits = std::to_string(n);
        std::string out;
        out.reserve(digits.size() + digits.size() / 3);
        size_t lead = digits.size() % 3;
        for (size_t i = 0; i < digits.size(); ++i) {
            if (i && (i + 3 - lead) % 3 == 0) out.push_back(',');
            out.push_back(digits[i]);
        }
        return out;
    }

private:
    // Out of line so the library and the tools share one flag
    static bool& quiet();
};

} // namespace SixDegrees
