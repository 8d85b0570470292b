/**
 * @file entity_loader.hpp
 * @brief Bulk load of the movie, rating and people dumps
 *
 * Each load replaces its table wholesale: drop (cascading), recreate, stream
 * the dump in batches. Movies must be loaded before ratings; movies and people
 * must both be loaded before edges (see EdgeLoader).
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <ingestion/load_report.hpp>
#include <export.hpp>
#include <string>

namespace SixDegrees {

class SIXDEGREES_API EntityLoader {
public:
    explicit EntityLoader(PostgresConnection& db, LoadOptions options = {});

    /**
     * @brief Load title.basics into movies. Duplicate ids are fatal.
     */
    LoadReport load_movies(const std::string& path);

    /**
     * @brief Load name.basics into people. Duplicate ids are fatal.
     */
    LoadReport load_people(const std::string& path);

    /**
     * @brief Load title.ratings into ratings.
     *
     * Rows whose movie is not in the movies table are skipped and counted
     * as skipped_missing_movie.
     */
    LoadReport load_ratings(const std::string& path);

private:
    PostgresConnection& db_;
    LoadOptions options_;
};

} // namespace SixDegrees
