/**
 * @file cleaning_stage.hpp
 * @brief Post-load retention rules for movies, cascading to edges and people
 */

#pragma once

#include <config/pipeline_config.hpp>
#include <database/postgres_connection.hpp>
#include <export.hpp>
#include <string>

namespace SixDegrees {

struct SIXDEGREES_API CleaningReport {
    size_t adult_movies = 0;
    size_t title_type_movies = 0;
    size_t low_vote_movies = 0;
    size_t excluded_genre_movies = 0;
    size_t cascaded_edges = 0;
    size_t cascaded_ratings = 0;
    size_t orphaned_people = 0;
    double seconds = 0.0;

    size_t movies_deleted() const {
        return adult_movies + title_type_movies + low_vote_movies + excluded_genre_movies;
    }

    size_t rows_deleted() const {
        return movies_deleted() + cascaded_edges + cascaded_ratings + orphaned_people;
    }

    std::string summary() const;
};

/**
 * @brief Deletes movies outside the graph's scope, then isolated people.
 *
 * Rules run in a fixed order, each a single DELETE against movies:
 *   1. adult-flagged titles (when drop_adult)
 *   2. title category absent or not in retained_title_types
 *   3. fewer than min_votes votes; a movie with no rating row counts as zero
 *   4. any genre token in excluded_genres (whole comma-separated tokens)
 * Foreign keys cascade the movie deletions to ratings and edges. Finally every
 * person left without an edge is deleted.
 *
 * The whole stage is one transaction. Running it on an already-cleaned store
 * deletes nothing.
 */
class SIXDEGREES_API CleaningStage {
public:
    explicit CleaningStage(PostgresConnection& db, CleaningRules rules = {});

    CleaningReport run();

private:
    PostgresConnection& db_;
    CleaningRules rules_;
};

} // namespace SixDegrees
