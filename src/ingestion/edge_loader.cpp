#include <ingestion/edge_loader.hpp>
#include <ingestion/batched_copy.hpp>
#include <ingestion/dump_rows.hpp>
#include <ingestion/key_index.hpp>
#include <ingestion/tsv_reader.hpp>
#include <storage/role_category.hpp>
#include <storage/schema.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <set>

namespace SixDegrees {

EdgeLoader::EdgeLoader(PostgresConnection& db, LoadOptions options)
    : db_(db), options_(options) {}

LoadReport EdgeLoader::load(const std::string& path) {
    Timer timer;
    Logger::step("Loading edges from " + path);

    TsvReader reader(path);
    const auto cols = EdgeColumns::from(reader);

    const KeyIndex people = KeyIndex::load(db_, "people");
    const KeyIndex movies = KeyIndex::load(db_, "movies");
    Schema::recreate(db_, Table::Edges);

    LoadReport report;
    report.table = "edges";
    SkipLog skips("edges");
    std::set<std::string> drifted_roles;

    BatchedCopy copy(db_, "edges", {"person_id", "movie_id", "role"}, options_.batch_size,
                     "ON CONFLICT (person_id, movie_id) DO NOTHING");

    TsvRow row;
    while (reader.next(row)) {
        ++report.rows_read;
        EdgeRow e = parse_edge(row, cols);

        if (!people.contains(e.person_id)) {
            ++report.skipped_missing_person;
            skips.record("missing person", std::to_string(e.person_id));
            continue;
        }
        if (!movies.contains(e.movie_id)) {
            ++report.skipped_missing_movie;
            skips.record("missing movie", std::to_string(e.movie_id));
            continue;
        }

        auto role = e.category ? parse_role_category(*e.category) : std::nullopt;
        if (!role) {
            ++report.skipped_unknown_role;
            std::string token = e.category.value_or("<absent>");
            if (drifted_roles.insert(token).second) {
                Logger::warn("edges: unrecognised role category '" + token +
                             "' at line " + std::to_string(row.line()) + "; dataset has drifted from RoleCategory");
            }
            continue;
        }

        copy.add_row({
            std::to_string(e.person_id),
            std::to_string(e.movie_id),
            std::string(role_token(*role)),
        });
    }
    copy.finish();

    report.rows_inserted = copy.rows_landed();
    report.duplicates = copy.rows_sent() - copy.rows_landed();
    report.batches = copy.batches();
    report.seconds = timer.elapsed_sec();
    Logger::success(report.summary());
    report.enforce_skip_ratio(options_.max_skip_ratio);
    return report;
}

} // namespace SixDegrees
