/**
 * @file ingest_pipeline.hpp
 * @brief Full rebuild of the graph store from the four dataset dumps
 */

#pragma once

#include <config/pipeline_config.hpp>
#include <database/postgres_connection.hpp>
#include <ingestion/cleaning_stage.hpp>
#include <ingestion/index_builder.hpp>
#include <ingestion/load_report.hpp>
#include <export.hpp>
#include <map>
#include <string>

namespace SixDegrees {

struct SIXDEGREES_API IngestReport {
    LoadReport movies;
    LoadReport ratings;
    LoadReport people;
    LoadReport edges;
    IndexReport indexes;
    CleaningReport cleaning;
    std::map<std::string, size_t> final_counts;  // table name -> rows
    double seconds = 0.0;
};

/**
 * @brief Drop, load, index, clean, analyze.
 *
 *   1. all four dump files must exist (SchemaError otherwise, nothing dropped)
 *   2. drop movies, ratings, people, edges
 *   3. movies, ratings, people, edges, in that order
 *   4. IndexBuilder, then CleaningStage (its cascades probe the indexed columns)
 *   5. ANALYZE
 */
class SIXDEGREES_API IngestPipeline {
public:
    IngestPipeline(PostgresConnection& db, PipelineConfig config);

    /**
     * @brief Rebuild the store from the dumps.
     *
     * Indexes are built before cleaning, not after it: the cleaning deletes
     * cascade through edges.movie_id and would scan the whole edges table per
     * movie without the index. The cleaned store is the same either way.
     */
    IngestReport run();

    /**
     * @brief Throws SchemaError listing every configured dump that is missing.
     */
    void verify_inputs() const;

    const PipelineConfig& config() const { return config_; }

private:
    PostgresConnection& db_;
    PipelineConfig config_;
};

} // namespace SixDegrees
