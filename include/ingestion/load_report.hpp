#pragma once

#include <export.hpp>
#include <cstddef>
#include <map>
#include <string>
#include <utility>

namespace SixDegrees {

struct LoadOptions {
    size_t batch_size = 100000;
    double max_skip_ratio = 1.0;
};

/**
 * @brief Outcome of loading one dump file into one table.
 */
struct SIXDEGREES_API LoadReport {
    std::string table;
    size_t rows_read = 0;
    size_t rows_inserted = 0;
    size_t skipped_missing_person = 0;
    size_t skipped_missing_movie = 0;
    size_t skipped_unknown_role = 0;
    size_t duplicates = 0;
    size_t batches = 0;
    double seconds = 0.0;

    size_t skipped() const {
        return skipped_missing_person + skipped_missing_movie + skipped_unknown_role;
    }

    double skip_ratio() const {
        return rows_read ? static_cast<double>(skipped()) / static_cast<double>(rows_read) : 0.0;
    }

    /**
     * @brief Throws LoadError when skip_ratio() exceeds max_ratio.
     */
    void enforce_skip_ratio(double max_ratio) const;

    std::string summary() const;
};

/**
 * @brief Logs the first few skipped rows of each cause, then stays quiet.
 *
 * The LoadReport counters are the record of what was skipped; this only
 * gives an operator enough samples to recognise the pattern.
 */
class SIXDEGREES_API SkipLog {
public:
    explicit SkipLog(std::string table, size_t samples_per_cause = 5)
        : table_(std::move(table)), samples_(samples_per_cause) {}

    void record(const std::string& cause, const std::string& detail);

private:
    std::string table_;
    size_t samples_;
    std::map<std::string, size_t> seen_;
};

} // namespace SixDegrees
