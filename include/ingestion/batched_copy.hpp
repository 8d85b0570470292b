#pragma once

#include <database/bulk_copy.hpp>
#include <database/postgres_connection.hpp>
#include <export.hpp>
#include <optional>
#include <string>
#include <vector>

namespace SixDegrees {

/**
 * @brief BulkCopy that commits every batch_size rows.
 *
 * Each batch is its own transaction. A failure loses at most the open batch;
 * earlier batches stay committed, which is acceptable because every load
 * starts from a freshly recreated table.
 *
 * With a conflict clause the rows are staged through a temp table and
 * duplicates are absorbed; without one they go straight into the table.
 */
class SIXDEGREES_API BatchedCopy {
public:
    BatchedCopy(PostgresConnection& db,
                const std::string& table,
                const std::vector<std::string>& columns,
                size_t batch_size,
                const std::string& conflict_clause = "");

    void add_row(const std::vector<BulkCopy::Value>& values);

    // Commit the trailing partial batch
    void finish();

    size_t rows_sent() const { return sent_ + pending_; }
    size_t rows_landed() const { return landed_; }
    size_t batches() const { return batches_; }

private:
    void commit_batch();

    PostgresConnection& db_;
    std::string table_;
    size_t batch_size_;
    // Declared before copy_ so an abandoned COPY is aborted before the rollback
    std::optional<PostgresConnection::Transaction> tx_;
    BulkCopy copy_;
    size_t pending_ = 0;
    size_t sent_ = 0;
    size_t landed_ = 0;
    size_t batches_ = 0;
};

} // namespace SixDegrees
