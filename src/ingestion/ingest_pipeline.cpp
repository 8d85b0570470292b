#include <ingestion/ingest_pipeline.hpp>
#include <ingestion/edge_loader.hpp>
#include <ingestion/entity_loader.hpp>
#include <storage/schema.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <filesystem>

namespace SixDegrees {

IngestPipeline::IngestPipeline(PostgresConnection& db, PipelineConfig config)
    : db_(db), config_(std::move(config)) {}

void IngestPipeline::verify_inputs() const {
    std::string missing;
    for (const std::string* file : {&config_.files.movies, &config_.files.ratings,
                                    &config_.files.people, &config_.files.edges}) {
        const std::string path = config_.path_of(*file);
        if (!std::filesystem::is_regular_file(path)) {
            if (!missing.empty()) missing += ", ";
            missing += path;
        }
    }
    if (!missing.empty()) {
        throw SchemaError("dump files not found: " + missing);
    }
}

IngestReport IngestPipeline::run() {
    Timer timer;
    Logger::info("Rebuilding graph store from " + config_.data_dir);

    verify_inputs();
    Schema::drop_all(db_);

    LoadOptions options;
    options.batch_size = config_.batch_size;
    options.max_skip_ratio = config_.max_skip_ratio;

    IngestReport report;

    EntityLoader entities(db_, options);
    report.movies = entities.load_movies(config_.path_of(config_.files.movies));
    report.ratings = entities.load_ratings(config_.path_of(config_.files.ratings));
    report.people = entities.load_people(config_.path_of(config_.files.people));

    EdgeLoader edges(db_, options);
    report.edges = edges.load(config_.path_of(config_.files.edges));

    report.indexes = IndexBuilder(db_).build();
    report.cleaning = CleaningStage(db_, config_.cleaning).run();

    Logger::step("Refreshing planner statistics");
    db_.execute("ANALYZE");

    for (Table table : Schema::tables()) {
        report.final_counts[Schema::name(table)] = Schema::row_count(db_, table);
    }

    report.seconds = timer.elapsed_sec();
    Logger::info("Graph store ready: " +
                 Logger::count(report.final_counts["people"]) + " people, " +
                 Logger::count(report.final_counts["movies"]) + " movies, " +
                 Logger::count(report.final_counts["edges"]) + " edges (" +
                 timer.format() + ")");
    return report;
}

} // namespace SixDegrees
