/**
 * @file schema.hpp
 * @brief Graph store tables: DDL, rebuild and startup checks
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <export.hpp>
#include <string>
#include <vector>

namespace SixDegrees {

enum class Table {
    Movies,
    Ratings,
    People,
    Edges
};

/**
 * @brief Table layout of the graph store
 *
 *   movies (id PK, title, year, title_type, is_adult, runtime, genres)
 *   ratings(movie_id PK -> movies ON DELETE CASCADE, average, num_votes)
 *   people (id PK, name, birth, death, known_for)
 *   edges  (person_id -> people, movie_id -> movies, role,
 *           UNIQUE(person_id, movie_id)), both references cascade
 */
class SIXDEGREES_API Schema {
public:
    // Parents first; drop in reverse
    static const std::vector<Table>& tables();

    static std::string name(Table table);
    static std::string ddl(Table table);

    /**
     * @brief DROP TABLE IF EXISTS ... CASCADE, then CREATE.
     */
    static void recreate(PostgresConnection& db, Table table);

    static void drop_all(PostgresConnection& db);

    static bool table_exists(PostgresConnection& db, const std::string& table_name);

    /**
     * @brief Throws SchemaError naming every missing table.
     */
    static void require_tables(PostgresConnection& db);

    static size_t row_count(PostgresConnection& db, Table table);
};

} // namespace SixDegrees
