/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace SixDegrees {

std::string PostgresConnection::conninfo_from_env() {
    std::ostringstream conninfo;

    const char* host = std::getenv("PGHOST");
    const char* port = std::getenv("PGPORT");
    const char* dbname = std::getenv("PGDATABASE");
    const char* user = std::getenv("PGUSER");
    const char* password = std::getenv("PGPASSWORD");

    conninfo << "host=" << (host ? host : "localhost") << " ";
    conninfo << "port=" << (port ? port : "5432") << " ";
    conninfo << "dbname=" << (dbname ? dbname : "sixdegrees") << " ";
    conninfo << "user=" << (user ? user : "postgres") << " ";

    if (password) {
        conninfo << "password=" << password << " ";
    }

    return conninfo.str();
}

PostgresConnection::PostgresConnection() {
    connect(conninfo_from_env());
}

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

PostgresConnection::PostgresConnection(PostgresConnection&& other) noexcept
    : conn_(other.conn_) {
    other.conn_ = nullptr;
}

PostgresConnection& PostgresConnection::operator=(PostgresConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        conn_ = other.conn_;
        other.conn_ = nullptr;
    }
    return *this;
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string message = error_message();
        PQfinish(conn_);
        conn_ = nullptr;
        throw std::runtime_error("PostgreSQL connection failed: " + message);
    }

    // The store is always rebuilt from scratch, so a lost tail of commits is recoverable
    try {
        execute("SET synchronous_commit = off");
    } catch (...) {
        disconnect();
        throw;
    }
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

void PostgresConnection::require_connection() const {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        throw std::runtime_error("Not connected to database");
    }
}

std::string PostgresConnection::error_message() const {
    return conn_ ? PQerrorMessage(conn_) : std::string();
}

void PostgresConnection::check_result(PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK &&
        status != PGRES_COPY_IN && status != PGRES_COPY_OUT) {
        std::string message = error_message();
        PQclear(result);
        throw std::runtime_error("PostgreSQL query failed: " + message);
    }
}

PGresult* PostgresConnection::exec(const std::string& sql, const std::vector<std::string>& params) {
    require_connection();

    PGresult* result = nullptr;
    if (params.empty()) {
        // PQexec accepts several ;-separated statements, PQexecParams does not
        result = PQexec(conn_, sql.c_str());
    } else {
        std::vector<const char*> param_values;
        param_values.reserve(params.size());
        for (const auto& p : params) {
            param_values.push_back(p.c_str());
        }

        result = PQexecParams(
            conn_,
            sql.c_str(),
            static_cast<int>(params.size()),
            nullptr,
            param_values.data(),
            nullptr,
            nullptr,
            0  // Text format
        );
    }

    check_result(result);
    return result;
}

long long PostgresConnection::affected_rows(PGresult* result) {
    const char* tuples = PQcmdTuples(result);
    if (!tuples || !*tuples) return 0;
    return std::strtoll(tuples, nullptr, 10);
}

void PostgresConnection::execute(const std::string& sql) {
    PQclear(exec(sql, {}));
}

void PostgresConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    PQclear(exec(sql, params));
}

long long PostgresConnection::execute_affected(const std::string& sql) {
    return execute_affected(sql, {});
}

long long PostgresConnection::execute_affected(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = exec(sql, params);
    long long n = affected_rows(result);
    PQclear(result);
    return n;
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql) {
    return query_single(sql, {});
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = exec(sql, params);

    std::optional<std::string> value;
    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

void PostgresConnection::query(const std::string& sql, const RowCallback& callback) {
    query(sql, {}, callback);
}

void PostgresConnection::query(const std::string& sql, const std::vector<std::string>& params,
                               const RowCallback& callback) {
    PGresult* result = exec(sql, params);

    int nrows = PQntuples(result);
    int nfields = PQnfields(result);

    try {
        Row row;
        row.reserve(nfields);
        for (int i = 0; i < nrows; ++i) {
            row.clear();
            for (int j = 0; j < nfields; ++j) {
                if (PQgetisnull(result, i, j)) {
                    row.emplace_back(std::nullopt);
                } else {
                    row.emplace_back(std::string(PQgetvalue(result, i, j), PQgetlength(result, i, j)));
                }
            }
            callback(row);
        }
    } catch (...) {
        PQclear(result);
        throw;
    }

    PQclear(result);
}

void PostgresConnection::copy_data(const char* buffer, int nbytes) {
    require_connection();

    if (PQputCopyData(conn_, buffer, nbytes) == -1) {
        throw std::runtime_error("COPY data failed: " + error_message());
    }
}

long long PostgresConnection::copy_end(const char* error_msg) {
    require_connection();

    if (PQputCopyEnd(conn_, error_msg) == -1) {
        throw std::runtime_error("COPY end failed: " + error_message());
    }

    // After sending end, we must drain the final result(s)
    long long rows = 0;
    PGresult* res;
    while ((res = PQgetResult(conn_)) != nullptr) {
        check_result(res);
        rows += affected_rows(res);
        PQclear(res);
    }
    return rows;
}

PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.execute("BEGIN");
}

PostgresConnection::Transaction::~Transaction() {
    if (!committed_) {
        try {
            conn_.execute("ROLLBACK");
        } catch (const std::exception&) {
            // Already unwinding; the original error is the one worth reporting
        }
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.execute("COMMIT");
    committed_ = true;
}

} // namespace SixDegrees
