#include <ingestion/key_index.hpp>
#include <database/bulk_copy.hpp>
#include <storage/schema.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>

namespace SixDegrees {

KeyIndex KeyIndex::load(PostgresConnection& db, const std::string& table, const std::string& column) {
    if (!Schema::table_exists(db, table)) {
        throw SchemaError("table '" + table + "' must be loaded first");
    }

    KeyIndex index;
    auto count = db.query_single("SELECT count(*) FROM " + BulkCopy::quote_identifier(table));
    if (count) {
        index.keys_.reserve(static_cast<size_t>(std::stoull(*count)));
    }

    db.query("SELECT " + BulkCopy::quote_identifier(column) + " FROM " + BulkCopy::quote_identifier(table),
             [&](const PostgresConnection::Row& row) {
                 if (row[0]) index.keys_.insert(std::stoll(*row[0]));
             });

    Logger::info("Cached " + Logger::count(index.size()) + " keys of " + table);
    return index;
}

} // namespace SixDegrees
