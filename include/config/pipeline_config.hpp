/**
 * @file pipeline_config.hpp
 * @brief Load/clean/search settings, optionally read from a JSON file
 *
 * Database settings are not here; PostgresConnection reads the standard
 * PG* environment variables.
 *
 * Example:
 *   {
 *     "data_dir": "/data/imdb",
 *     "batch_size": 100000,
 *     "max_skip_ratio": 0.25,
 *     "cleaning": { "min_votes": 50, "excluded_genres": ["News", "Adult"] },
 *     "search": { "max_nodes": 500000 }
 *   }
 */

#pragma once

#include <export.hpp>
#include <nlohmann/json_fwd.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace SixDegrees {

struct DatasetFiles {
    std::string movies = "title.basics.tsv";
    std::string people = "name.basics.tsv";
    std::string ratings = "title.ratings.tsv";
    std::string edges = "title.principals.tsv";
};

/**
 * @brief Retention rules of the cleaning stage, applied in field order.
 */
struct CleaningRules {
    bool drop_adult = true;
    std::vector<std::string> retained_title_types = {"movie", "short", "tvSeries", "tvMiniSeries"};
    int64_t min_votes = 20;
    std::vector<std::string> excluded_genres = {"News", "Talk-Show", "Reality-TV", "Adult"};
};

struct SearchSettings {
    size_t max_nodes = 1000000;
};

/**
 * @brief Parse a command-line node ceiling; ConfigError unless it is a positive
 * decimal that fits in size_t.
 */
SIXDEGREES_API size_t parse_max_nodes(std::string_view text);

struct SIXDEGREES_API PipelineConfig {
    std::string data_dir = ".";
    DatasetFiles files;
    size_t batch_size = 100000;
    double max_skip_ratio = 1.0;  // 1.0: skipped rows never fail a load
    CleaningRules cleaning;
    SearchSettings search;

    std::string path_of(const std::string& file) const;

    /**
     * @brief Overlay the keys present in j onto the defaults.
     *
     * Throws ConfigError for wrong types or out-of-range values.
     */
    static PipelineConfig from_json(const nlohmann::json& j);

    /**
     * @brief Read and parse a JSON file; ConfigError if unreadable or invalid.
     */
    static PipelineConfig load(const std::string& path);

    nlohmann::json to_json() const;
};

} // namespace SixDegrees
