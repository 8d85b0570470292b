/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <export.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace SixDegrees {

/**
 * @brief PostgreSQL connection wrapper
 *
 * Owns one libpq connection to the graph store. Every loader, stage and
 * query component receives a reference to one of these; there is no
 * process-wide connection.
 */
class SIXDEGREES_API PostgresConnection {
public:
    /// One result row; SQL NULL is std::nullopt.
    using Row = std::vector<std::optional<std::string>>;
    using RowCallback = std::function<void(const Row&)>;

    /**
     * @brief Connect using environment variables
     *
     * Uses: PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD
     * Defaults: localhost, 5432, sixdegrees, postgres, (no password)
     */
    PostgresConnection();

    /**
     * @brief Connect with explicit connection string
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    // Move OK
    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    /**
     * @brief Build the libpq connection string from the PG* environment
     */
    static std::string conninfo_from_env();

    /**
     * @brief Execute statement (no results expected)
     */
    void execute(const std::string& sql);
    void execute(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute a command and return the number of rows it touched
     *
     * Reads PQcmdTuples, so it is meaningful for INSERT/UPDATE/DELETE.
     */
    long long execute_affected(const std::string& sql);
    long long execute_affected(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief First column of the first row, nullopt for no rows or NULL
     */
    std::optional<std::string> query_single(const std::string& sql);
    std::optional<std::string> query_single(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query and iterate rows
     */
    void query(const std::string& sql, const RowCallback& callback);
    void query(const std::string& sql, const std::vector<std::string>& params, const RowCallback& callback);

    /**
     * @brief Stream a chunk of COPY FROM STDIN data
     */
    void copy_data(const char* buffer, int nbytes);

    /**
     * @brief Finish the COPY; returns the row count reported by the server
     */
    long long copy_end(const char* error_msg = nullptr);

    /**
     * @brief RAII transaction guard
     *
     * Rolls back on destruction unless commit() ran.
     */
    class SIXDEGREES_API Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        PostgresConnection& conn_;
        bool committed_ = false;
    };

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void require_connection() const;
    std::string error_message() const;
    PGresult* exec(const std::string& sql, const std::vector<std::string>& params);
    void check_result(PGresult* result);
    static long long affected_rows(PGresult* result);

    PGconn* conn_ = nullptr;
};

} // namespace SixDegrees
