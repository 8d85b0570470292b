#include <ingestion/index_builder.hpp>
#include <database/bulk_copy.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

namespace SixDegrees {

IndexBuilder::IndexBuilder(PostgresConnection& db) : db_(db) {}

const std::vector<IndexSpec>& IndexBuilder::indexes() {
    static const std::vector<IndexSpec> specs = {
        {"edges_movie_id_idx", "edges", "movie_id"},
        {"edges_person_id_idx", "edges", "person_id"},
        {"ratings_movie_id_idx", "ratings", "movie_id"},
    };
    return specs;
}

bool IndexBuilder::index_exists(const std::string& name) {
    auto found = db_.query_single(
        "SELECT EXISTS (SELECT 1 FROM pg_indexes "
        "WHERE schemaname = current_schema() AND indexname = $1)",
        {name});
    return found && *found == "t";
}

IndexReport IndexBuilder::build() {
    Timer timer;
    Logger::step("Building indexes");

    IndexReport report;
    for (const auto& spec : indexes()) {
        if (index_exists(spec.name)) {
            report.existing.push_back(spec.name);
            continue;
        }
        Timer one;
        db_.execute("CREATE INDEX IF NOT EXISTS " + BulkCopy::quote_identifier(spec.name) +
                    " ON " + BulkCopy::quote_identifier(spec.table) +
                    " (" + BulkCopy::quote_identifier(spec.column) + ")");
        Logger::info("Created " + spec.name + " in " + one.format());
        report.created.push_back(spec.name);
    }

    report.seconds = timer.elapsed_sec();
    Logger::success("Indexes: " + std::to_string(report.created.size()) + " created, " +
                    std::to_string(report.existing.size()) + " already present (" +
                    timer.format() + ")");
    return report;
}

} // namespace SixDegrees
