#include <ingestion/cleaning_stage.hpp>
#include <database/pg_array.hpp>
#include <storage/schema.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

namespace SixDegrees {

std::string CleaningReport::summary() const {
    return "removed " + Logger::count(movies_deleted()) + " movies (" +
           Logger::count(adult_movies) + " adult, " +
           Logger::count(title_type_movies) + " title type, " +
           Logger::count(low_vote_movies) + " low votes, " +
           Logger::count(excluded_genre_movies) + " excluded genre), " +
           Logger::count(cascaded_edges) + " edges, " +
           Logger::count(cascaded_ratings) + " ratings, " +
           Logger::count(orphaned_people) + " isolated people (" +
           Timer::format_seconds(seconds) + ")";
}

CleaningStage::CleaningStage(PostgresConnection& db, CleaningRules rules)
    : db_(db), rules_(std::move(rules)) {}

CleaningReport CleaningStage::run() {
    Timer timer;
    Logger::step("Cleaning graph store");

    CleaningReport report;
    PostgresConnection::Transaction tx(db_);

    const size_t edges_before = Schema::row_count(db_, Table::Edges);
    const size_t ratings_before = Schema::row_count(db_, Table::Ratings);

    if (rules_.drop_adult) {
        report.adult_movies = static_cast<size_t>(db_.execute_affected(
            "DELETE FROM movies WHERE is_adult <> 0"));
    }

    report.title_type_movies = static_cast<size_t>(db_.execute_affected(
        "DELETE FROM movies "
        "WHERE title_type IS NULL OR NOT (title_type = ANY ($1::text[]))",
        {text_array_literal(rules_.retained_title_types)}));

    report.low_vote_movies = static_cast<size_t>(db_.execute_affected(
        "DELETE FROM movies m "
        "WHERE NOT EXISTS ("
        "  SELECT 1 FROM ratings r "
        "  WHERE r.movie_id = m.id AND r.num_votes >= $1::bigint)",
        {std::to_string(rules_.min_votes)}));

    if (!rules_.excluded_genres.empty()) {
        report.excluded_genre_movies = static_cast<size_t>(db_.execute_affected(
            "DELETE FROM movies "
            "WHERE genres IS NOT NULL AND string_to_array(genres, ',') && $1::text[]",
            {text_array_literal(rules_.excluded_genres)}));
    }

    report.cascaded_edges = edges_before - Schema::row_count(db_, Table::Edges);
    report.cascaded_ratings = ratings_before - Schema::row_count(db_, Table::Ratings);

    report.orphaned_people = static_cast<size_t>(db_.execute_affected(
        "DELETE FROM people p "
        "WHERE NOT EXISTS (SELECT 1 FROM edges e WHERE e.person_id = p.id)"));

    tx.commit();

    report.seconds = timer.elapsed_sec();
    Logger::success("Cleaning: " + report.summary());
    return report;
}

} // namespace SixDegrees
