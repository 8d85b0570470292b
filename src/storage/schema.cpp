#include <storage/schema.hpp>
#include <utils/errors.hpp>
#include <stdexcept>

namespace SixDegrees {

const std::vector<Table>& Schema::tables() {
    static const std::vector<Table> order = {Table::Movies, Table::Ratings, Table::People, Table::Edges};
    return order;
}

std::string Schema::name(Table table) {
    switch (table) {
        case Table::Movies:  return "movies";
        case Table::Ratings: return "ratings";
        case Table::People:  return "people";
        case Table::Edges:   return "edges";
    }
    throw std::invalid_argument("Schema::name: unknown table");
}

std::string Schema::ddl(Table table) {
    switch (table) {
        case Table::Movies:
            return R"(
                CREATE TABLE movies (
                    id          BIGINT PRIMARY KEY,
                    title       TEXT NOT NULL,
                    year        INTEGER,
                    title_type  TEXT,
                    is_adult    INTEGER NOT NULL DEFAULT 0,
                    runtime     INTEGER,
                    genres      TEXT
                ))";
        case Table::Ratings:
            return R"(
                CREATE TABLE ratings (
                    movie_id    BIGINT PRIMARY KEY REFERENCES movies (id) ON DELETE CASCADE,
                    average     NUMERIC,
                    num_votes   INTEGER
                ))";
        case Table::People:
            return R"(
                CREATE TABLE people (
                    id          BIGINT PRIMARY KEY,
                    name        TEXT NOT NULL,
                    birth       INTEGER,
                    death       INTEGER,
                    known_for   TEXT
                ))";
        case Table::Edges:
            return R"(
                CREATE TABLE edges (
                    person_id   BIGINT NOT NULL REFERENCES people (id) ON DELETE CASCADE,
                    movie_id    BIGINT NOT NULL REFERENCES movies (id) ON DELETE CASCADE,
                    role        TEXT NOT NULL,
                    UNIQUE (person_id, movie_id)
                ))";
    }
    throw std::invalid_argument("Schema::ddl: unknown table");
}

void Schema::recreate(PostgresConnection& db, Table table) {
    db.execute("DROP TABLE IF EXISTS " + name(table) + " CASCADE");
    db.execute(ddl(table));
}

void Schema::drop_all(PostgresConnection& db) {
    const auto& order = tables();
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        db.execute("DROP TABLE IF EXISTS " + name(*it) + " CASCADE");
    }
}

bool Schema::table_exists(PostgresConnection& db, const std::string& table_name) {
    auto found = db.query_single(
        "SELECT EXISTS (SELECT 1 FROM information_schema.tables "
        "WHERE table_schema = current_schema() AND table_name = $1)",
        {table_name});
    return found && *found == "t";
}

void Schema::require_tables(PostgresConnection& db) {
    std::string missing;
    for (Table table : tables()) {
        if (!table_exists(db, name(table))) {
            if (!missing.empty()) missing += ", ";
            missing += name(table);
        }
    }
    if (!missing.empty()) {
        throw SchemaError("mandatory tables not found: " + missing + " (run sixdegrees_load first)");
    }
}

size_t Schema::row_count(PostgresConnection& db, Table table) {
    auto n = db.query_single("SELECT count(*) FROM " + name(table));
    return n ? static_cast<size_t>(std::stoull(*n)) : 0;
}

} // namespace SixDegrees
