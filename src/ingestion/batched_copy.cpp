#include <ingestion/batched_copy.hpp>
#include <utils/logger.hpp>
#include <stdexcept>

namespace SixDegrees {

BatchedCopy::BatchedCopy(PostgresConnection& db,
                         const std::string& table,
                         const std::vector<std::string>& columns,
                         size_t batch_size,
                         const std::string& conflict_clause)
    : db_(db), table_(table), batch_size_(batch_size), copy_(db, !conflict_clause.empty()) {
    if (batch_size_ == 0) {
        throw std::invalid_argument("BatchedCopy: batch_size must be positive");
    }
    copy_.begin_table(table, columns);
    if (!conflict_clause.empty()) {
        copy_.set_conflict_clause(conflict_clause);
    }
}

void BatchedCopy::add_row(const std::vector<BulkCopy::Value>& values) {
    if (!tx_) tx_.emplace(db_);
    copy_.add_row(values);
    if (++pending_ >= batch_size_) {
        commit_batch();
    }
}

void BatchedCopy::commit_batch() {
    landed_ += copy_.flush();
    tx_->commit();
    tx_.reset();

    sent_ += pending_;
    pending_ = 0;
    ++batches_;
    Logger::bulk("Inserted " + Logger::count(sent_) + " records into " + table_);
}

void BatchedCopy::finish() {
    if (pending_ > 0) {
        commit_batch();
    }
}

} // namespace SixDegrees
