/**
 * @file index_builder.hpp
 * @brief Join-column indexes for the adjacency queries
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <export.hpp>
#include <string>
#include <vector>

namespace SixDegrees {

struct IndexSpec {
    std::string name;
    std::string table;
    std::string column;
};

struct SIXDEGREES_API IndexReport {
    std::vector<std::string> created;
    std::vector<std::string> existing;
    double seconds = 0.0;
};

/**
 * @brief Builds the secondary indexes once bulk inserts are done.
 *
 * edges(movie_id), edges(person_id) and ratings(movie_id). An index that is
 * already present is reported under `existing` and left alone.
 */
class SIXDEGREES_API IndexBuilder {
public:
    explicit IndexBuilder(PostgresConnection& db);

    static const std::vector<IndexSpec>& indexes();

    IndexReport build();

    bool index_exists(const std::string& name);

private:
    PostgresConnection& db_;
};

} // namespace SixDegrees
