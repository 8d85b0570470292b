#include <config/pipeline_config.hpp>
#include <utils/errors.hpp>
#include <nlohmann/json.hpp>
#include <charconv>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace SixDegrees {

namespace {

template <typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    out = it->get<T>();
}

} // namespace

size_t parse_max_nodes(std::string_view text) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        throw ConfigError("max-nodes '" + std::string(text) + "' is not a node count");
    }
    if (value == 0) {
        throw ConfigError("max-nodes must be positive");
    }
    return value;
}

std::string PipelineConfig::path_of(const std::string& file) const {
    return (fs::path(data_dir) / file).string();
}

PipelineConfig PipelineConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("top level must be a JSON object");
    }

    PipelineConfig config;
    int64_t batch_size = static_cast<int64_t>(config.batch_size);
    int64_t max_nodes = static_cast<int64_t>(config.search.max_nodes);

    try {
        read_key(j, "data_dir", config.data_dir);
        read_key(j, "batch_size", batch_size);
        read_key(j, "max_skip_ratio", config.max_skip_ratio);

        if (auto files = j.find("files"); files != j.end()) {
            read_key(*files, "movies", config.files.movies);
            read_key(*files, "people", config.files.people);
            read_key(*files, "ratings", config.files.ratings);
            read_key(*files, "edges", config.files.edges);
        }

        if (auto cleaning = j.find("cleaning"); cleaning != j.end()) {
            read_key(*cleaning, "drop_adult", config.cleaning.drop_adult);
            read_key(*cleaning, "retained_title_types", config.cleaning.retained_title_types);
            read_key(*cleaning, "min_votes", config.cleaning.min_votes);
            read_key(*cleaning, "excluded_genres", config.cleaning.excluded_genres);
        }

        if (auto search = j.find("search"); search != j.end()) {
            read_key(*search, "max_nodes", max_nodes);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(e.what());
    }

    if (batch_size <= 0) {
        throw ConfigError("batch_size must be positive");
    }
    if (max_nodes <= 0) {
        throw ConfigError("search.max_nodes must be positive");
    }
    if (config.max_skip_ratio < 0.0 || config.max_skip_ratio > 1.0) {
        throw ConfigError("max_skip_ratio must be within [0, 1]");
    }
    if (config.cleaning.min_votes < 0) {
        throw ConfigError("cleaning.min_votes must not be negative");
    }

    config.batch_size = static_cast<size_t>(batch_size);
    config.search.max_nodes = static_cast<size_t>(max_nodes);
    return config;
}

PipelineConfig PipelineConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("could not open " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
    return from_json(j);
}

nlohmann::json PipelineConfig::to_json() const {
    return {
        {"data_dir", data_dir},
        {"files", {
            {"movies", files.movies},
            {"people", files.people},
            {"ratings", files.ratings},
            {"edges", files.edges},
        }},
        {"batch_size", batch_size},
        {"max_skip_ratio", max_skip_ratio},
        {"cleaning", {
            {"drop_adult", cleaning.drop_adult},
            {"retained_title_types", cleaning.retained_title_types},
            {"min_votes", cleaning.min_votes},
            {"excluded_genres", cleaning.excluded_genres},
        }},
        {"search", {
            {"max_nodes", search.max_nodes},
        }},
    };
}

} // namespace SixDegrees
