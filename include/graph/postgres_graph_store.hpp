/**
 * @file postgres_graph_store.hpp
 * @brief GraphStore over the PostgreSQL tables built by IngestPipeline
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <graph/graph_store.hpp>
#include <export.hpp>

namespace SixDegrees {

class SIXDEGREES_API PostgresGraphStore : public GraphStore {
public:
    explicit PostgresGraphStore(PostgresConnection& db);

    std::vector<PersonId> co_stars(PersonId person) override;
    std::optional<PersonRecord> find_person(PersonId id) override;
    std::vector<PersonRecord> find_people_by_name(const std::string& fragment) override;
    std::vector<std::pair<MovieId, std::string>> movie_titles(const std::vector<MovieId>& ids) override;
    std::optional<SharedCredit> shared_credit(PersonId a, PersonId b) override;

private:
    PostgresConnection& db_;
};

} // namespace SixDegrees
