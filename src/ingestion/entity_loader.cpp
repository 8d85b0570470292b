#include <ingestion/entity_loader.hpp>
#include <ingestion/batched_copy.hpp>
#include <ingestion/dump_rows.hpp>
#include <ingestion/field_normalizer.hpp>
#include <ingestion/key_index.hpp>
#include <ingestion/tsv_reader.hpp>
#include <storage/schema.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

namespace SixDegrees {

EntityLoader::EntityLoader(PostgresConnection& db, LoadOptions options)
    : db_(db), options_(options) {}

LoadReport EntityLoader::load_movies(const std::string& path) {
    Timer timer;
    Logger::step("Loading movies from " + path);

    TsvReader reader(path);
    const auto cols = MovieColumns::from(reader);

    Schema::recreate(db_, Table::Movies);

    LoadReport report;
    report.table = "movies";

    BatchedCopy copy(db_, "movies",
                     {"id", "title", "year", "title_type", "is_adult", "runtime", "genres"},
                     options_.batch_size);

    TsvRow row;
    while (reader.next(row)) {
        ++report.rows_read;
        MovieRecord m = parse_movie(row, cols);
        copy.add_row({
            std::to_string(m.id),
            m.title,
            to_field(m.year),
            m.title_type,
            std::to_string(m.is_adult),
            to_field(m.runtime),
            m.genres,
        });
    }
    copy.finish();

    report.rows_inserted = copy.rows_landed();
    report.batches = copy.batches();
    report.seconds = timer.elapsed_sec();
    Logger::success(report.summary());
    return report;
}

LoadReport EntityLoader::load_people(const std::string& path) {
    Timer timer;
    Logger::step("Loading people from " + path);

    TsvReader reader(path);
    const auto cols = PersonColumns::from(reader);

    Schema::recreate(db_, Table::People);

    LoadReport report;
    report.table = "people";

    BatchedCopy copy(db_, "people",
                     {"id", "name", "birth", "death", "known_for"},
                     options_.batch_size);

    TsvRow row;
    while (reader.next(row)) {
        ++report.rows_read;
        PersonRecord p = parse_person(row, cols);
        copy.add_row({
            std::to_string(p.id),
            p.name,
            to_field(p.birth),
            to_field(p.death),
            p.known_for,
        });
    }
    copy.finish();

    report.rows_inserted = copy.rows_landed();
    report.batches = copy.batches();
    report.seconds = timer.elapsed_sec();
    Logger::success(report.summary());
    return report;
}

LoadReport EntityLoader::load_ratings(const std::string& path) {
    Timer timer;
    Logger::step("Loading ratings from " + path);

    TsvReader reader(path);
    const auto cols = RatingColumns::from(reader);

    const KeyIndex movies = KeyIndex::load(db_, "movies");
    Schema::recreate(db_, Table::Ratings);

    LoadReport report;
    report.table = "ratings";
    SkipLog skips("ratings");

    BatchedCopy copy(db_, "ratings", {"movie_id", "average", "num_votes"}, options_.batch_size);

    TsvRow row;
    while (reader.next(row)) {
        ++report.rows_read;
        RatingRecord r = parse_rating(row, cols);
        if (!movies.contains(r.movie_id)) {
            ++report.skipped_missing_movie;
            skips.record("missing movie", std::to_string(r.movie_id));
            continue;
        }
        copy.add_row({
            std::to_string(r.movie_id),
            to_field(r.average),
            to_field(r.num_votes),
        });
    }
    copy.finish();

    report.rows_inserted = copy.rows_landed();
    report.batches = copy.batches();
    report.seconds = timer.elapsed_sec();
    Logger::success(report.summary());
    report.enforce_skip_ratio(options_.max_skip_ratio);
    return report;
}

} // namespace SixDegrees
