#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace SixDegrees {

using PersonId = int64_t;
using MovieId = int64_t;

// Row shapes of the graph store. Ids are the numeric part of the dataset's
// external identifiers (nm0000102 -> 102, tt0087277 -> 87277).

struct MovieRecord {
    MovieId id = 0;
    std::string title;
    std::optional<int64_t> year;
    std::optional<std::string> title_type;
    int64_t is_adult = 0;
    std::optional<int64_t> runtime;
    std::optional<std::string> genres;  // comma-separated, e.g. "Drama,Romance"
};

struct PersonRecord {
    PersonId id = 0;
    std::string name;
    std::optional<int64_t> birth;
    std::optional<int64_t> death;
    std::optional<std::string> known_for;  // raw external ids, e.g. "tt0087277,tt0164052"
};

struct RatingRecord {
    MovieId movie_id = 0;
    std::optional<double> average;
    std::optional<int64_t> num_votes;
};

} // namespace SixDegrees
