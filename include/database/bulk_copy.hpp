#pragma once

#include <database/postgres_connection.hpp>
#include <export.hpp>
#include <atomic>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace SixDegrees {

/**
 * @brief Streams many rows into Postgres using COPY (text format).
 *
 * Usage:
 *   BulkCopy bc(conn);
 *   bc.begin_table("movies", {"id","title",...});
 *   for (...) bc.add_row({...});
 *   size_t landed = bc.flush();
 *
 * Notes:
 * - begin_table must be called before add_row.
 * - flush() finishes the COPY and returns how many rows reached the target.
 * - Runs inside whatever transaction is open on the connection.
 * - Not thread-safe; use one instance per connection.
 *
 * Modes:
 * - Staged (use_temp_table=true): COPY into a session temp table, then
 *   INSERT ... SELECT with the conflict clause. Duplicates are absorbed
 *   and the returned count excludes them.
 * - Direct (use_temp_table=false): COPY straight into the target table.
 *   A duplicate key aborts the COPY with an error.
 */
class SIXDEGREES_API BulkCopy {
public:
    using Value = std::optional<std::string>;

    explicit BulkCopy(PostgresConnection& db, bool use_temp_table = true) noexcept;
    ~BulkCopy();

    BulkCopy(const BulkCopy&) = delete;
    BulkCopy& operator=(const BulkCopy&) = delete;

    // Prepare for a target table and column list. Call once before add_row.
    void begin_table(const std::string& table_name, const std::vector<std::string>& columns);

    // Add a row. std::nullopt (or a missing trailing value) is written as NULL.
    void add_row(const std::vector<Value>& values);

    // Finish COPY and move rows into the target table. Returns rows landed.
    size_t flush();

    // ON CONFLICT clause for staged mode, e.g. "ON CONFLICT (a, b) DO NOTHING"
    void set_conflict_clause(const std::string& clause);

    static std::string quote_identifier(const std::string& id);

private:
    void start_copy_if_needed();
    void escape_value_into_buffer(const std::string& value);
    void send_buffer();
    std::string full_table_name() const;
    std::string column_list() const;

    PostgresConnection& db_;
    std::ostringstream buffer_;

    std::string schema_;
    std::string table_name_;
    std::vector<std::string> columns_;
    std::string temp_table_name_;
    size_t buffered_rows_ = 0;
    bool in_copy_ = false;
    bool use_temp_table_ = true;
    std::string conflict_clause_;

    static std::atomic<uint64_t> s_counter_;
    static constexpr size_t SEND_EVERY_ROWS = 50000;
};

} // namespace SixDegrees
