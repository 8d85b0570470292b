/**
 * @file edge_loader.hpp
 * @brief Bulk load of the appearance dump into the edges table
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <ingestion/load_report.hpp>
#include <export.hpp>
#include <string>

namespace SixDegrees {

/**
 * @brief Streams title.principals into edges(person_id, movie_id, role).
 *
 * Requires people and movies to be loaded. A row is skipped (counted, a few
 * samples logged) when its person is absent, else when its movie is absent,
 * else when its category is not a known RoleCategory. Rows repeating an
 * already-inserted (person, movie) pair are absorbed by ON CONFLICT and
 * counted as duplicates; exactly one row per pair survives.
 */
class SIXDEGREES_API EdgeLoader {
public:
    explicit EdgeLoader(PostgresConnection& db, LoadOptions options = {});

    LoadReport load(const std::string& path);

private:
    PostgresConnection& db_;
    LoadOptions options_;
};

} // namespace SixDegrees
