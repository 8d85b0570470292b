/**
 * @file dump_rows.hpp
 * @brief Column layouts of the four dumps and their row -> record parsers
 *
 *   title.basics     tconst titleType primaryTitle ... isAdult startYear ... runtimeMinutes genres
 *   name.basics      nconst primaryName birthYear deathYear ... knownForTitles
 *   title.ratings    tconst averageRating numVotes
 *   title.principals tconst ordering nconst category job characters
 *
 * Columns are located by header name, so extra or reordered columns are fine.
 */

#pragma once

#include <ingestion/tsv_reader.hpp>
#include <storage/records.hpp>
#include <export.hpp>
#include <optional>
#include <string>

namespace SixDegrees {

struct SIXDEGREES_API MovieColumns {
    size_t id, title, year, title_type, is_adult, runtime, genres;
    static MovieColumns from(const TsvReader& reader);
};

struct SIXDEGREES_API PersonColumns {
    size_t id, name, birth, death, known_for;
    static PersonColumns from(const TsvReader& reader);
};

struct SIXDEGREES_API RatingColumns {
    size_t movie_id, average, num_votes;
    static RatingColumns from(const TsvReader& reader);
};

struct SIXDEGREES_API EdgeColumns {
    size_t movie_id, person_id, category;
    static EdgeColumns from(const TsvReader& reader);
};

/**
 * @brief Appearance row before endpoint and role validation.
 */
struct EdgeRow {
    PersonId person_id = 0;
    MovieId movie_id = 0;
    std::optional<std::string> category;
};

// All parsers throw ParseError on malformed ids or numbers.
SIXDEGREES_API MovieRecord parse_movie(const TsvRow& row, const MovieColumns& cols);
SIXDEGREES_API PersonRecord parse_person(const TsvRow& row, const PersonColumns& cols);
SIXDEGREES_API RatingRecord parse_rating(const TsvRow& row, const RatingColumns& cols);
SIXDEGREES_API EdgeRow parse_edge(const TsvRow& row, const EdgeColumns& cols);

} // namespace SixDegrees
