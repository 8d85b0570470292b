#include <ingestion/load_report.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <cstdio>

namespace SixDegrees {

void LoadReport::enforce_skip_ratio(double max_ratio) const {
    if (skip_ratio() <= max_ratio) return;

    char buf[128];
    std::snprintf(buf, sizeof(buf), "%s: skipped %.2f%% of rows, limit is %.2f%%",
                  table.c_str(), skip_ratio() * 100.0, max_ratio * 100.0);
    throw LoadError(buf);
}

std::string LoadReport::summary() const {
    std::string s = table + ": " + Logger::count(rows_inserted) + " inserted of " +
                    Logger::count(rows_read) + " read";
    if (skipped_missing_person) s += ", " + Logger::count(skipped_missing_person) + " missing person";
    if (skipped_missing_movie)  s += ", " + Logger::count(skipped_missing_movie) + " missing movie";
    if (skipped_unknown_role)   s += ", " + Logger::count(skipped_unknown_role) + " unknown role";
    if (duplicates)             s += ", " + Logger::count(duplicates) + " duplicates";
    s += " (" + Timer::format_seconds(seconds) + ")";
    return s;
}

void SkipLog::record(const std::string& cause, const std::string& detail) {
    size_t n = ++seen_[cause];
    if (n <= samples_) {
        Logger::warn(table_ + ": skipping row, " + cause + " " + detail);
    } else if (n == samples_ + 1) {
        Logger::warn(table_ + ": further '" + cause + "' skips are counted but not logged");
    }
}

} // namespace SixDegrees
