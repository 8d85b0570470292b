#include <graph/postgres_graph_store.hpp>
#include <graph/name_match.hpp>
#include <database/pg_array.hpp>
#include <string>
#include <unordered_map>

namespace SixDegrees {

namespace {

std::optional<int64_t> opt_int(const std::optional<std::string>& v) {
    if (!v) return std::nullopt;
    return std::stoll(*v);
}

std::optional<double> opt_double(const std::optional<std::string>& v) {
    if (!v) return std::nullopt;
    return std::stod(*v);
}

// Columns: id, name, birth, death, known_for
PersonRecord person_from_row(const PostgresConnection::Row& row) {
    PersonRecord p;
    p.id = std::stoll(row[0].value());
    p.name = row[1].value_or("");
    p.birth = opt_int(row[2]);
    p.death = opt_int(row[3]);
    p.known_for = row[4];
    return p;
}

} // anonymous namespace

PostgresGraphStore::PostgresGraphStore(PostgresConnection& db) : db_(db) {}

std::vector<PersonId> PostgresGraphStore::co_stars(PersonId person) {
    std::vector<PersonId> out;
    db_.query(
        "SELECT DISTINCT e2.person_id "
        "FROM edges e1 JOIN edges e2 ON e1.movie_id = e2.movie_id "
        "WHERE e1.person_id = $1 AND e2.person_id <> $1 "
        "ORDER BY 1",
        {std::to_string(person)},
        [&](const PostgresConnection::Row& row) {
            out.push_back(std::stoll(row[0].value()));
        });
    return out;
}

std::optional<PersonRecord> PostgresGraphStore::find_person(PersonId id) {
    std::optional<PersonRecord> out;
    db_.query("SELECT id, name, birth, death, known_for FROM people WHERE id = $1",
              {std::to_string(id)},
              [&](const PostgresConnection::Row& row) { out = person_from_row(row); });
    return out;
}

std::vector<PersonRecord> PostgresGraphStore::find_people_by_name(const std::string& fragment) {
    std::vector<PersonRecord> out;
    db_.query("SELECT id, name, birth, death, known_for FROM people WHERE name ~* $1 ORDER BY id",
              {name_token_pattern(fragment)},
              [&](const PostgresConnection::Row& row) { out.push_back(person_from_row(row)); });
    return out;
}

std::vector<std::pair<MovieId, std::string>> PostgresGraphStore::movie_titles(const std::vector<MovieId>& ids) {
    std::vector<std::pair<MovieId, std::string>> out;
    if (ids.empty()) return out;

    std::unordered_map<MovieId, std::string> found;
    db_.query("SELECT id, title FROM movies WHERE id = ANY ($1::bigint[])",
              {int_array_literal(ids)},
              [&](const PostgresConnection::Row& row) {
                  found.emplace(std::stoll(row[0].value()), row[1].value_or(""));
              });

    for (MovieId id : ids) {
        auto it = found.find(id);
        if (it != found.end()) out.emplace_back(id, it->second);
    }
    return out;
}

std::optional<SharedCredit> PostgresGraphStore::shared_credit(PersonId a, PersonId b) {
    std::optional<SharedCredit> out;
    db_.query(R"(
        SELECT m.id, m.title, m.year, r.average, r.num_votes, ea.role, eb.role
        FROM edges ea
        JOIN edges eb ON eb.movie_id = ea.movie_id
        JOIN movies m ON m.id = ea.movie_id
        LEFT JOIN ratings r ON r.movie_id = m.id
        WHERE ea.person_id = $1 AND eb.person_id = $2
        ORDER BY r.num_votes DESC NULLS LAST, m.id
        LIMIT 1
    )",
              {std::to_string(a), std::to_string(b)},
              [&](const PostgresConnection::Row& row) {
                  SharedCredit c;
                  c.movie_id = std::stoll(row[0].value());
                  c.title = row[1].value_or("");
                  c.year = opt_int(row[2]);
                  c.average_rating = opt_double(row[3]);
                  c.num_votes = opt_int(row[4]);
                  c.role_a = row[5].value_or("");
                  c.role_b = row[6].value_or("");
                  out = std::move(c);
              });
    return out;
}

} // namespace SixDegrees
