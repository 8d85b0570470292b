/**
 * @file load_dataset.cpp
 * @brief Rebuild the graph store from the dataset dumps
 *
 * Usage: sixdegrees_load [config.json]
 * Database connection comes from PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD.
 */

#include <config/pipeline_config.hpp>
#include <database/postgres_connection.hpp>
#include <ingestion/ingest_pipeline.hpp>
#include <utils/logger.hpp>
#include <iostream>
#include <string>

using namespace SixDegrees;

static void print_load(const LoadReport& r) {
    std::cout << "  " << r.summary() << "\n";
}

int main(int argc, char** argv) {
    if (argc > 2 || (argc == 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help"))) {
        std::cerr << "Usage: " << argv[0] << " [config.json]" << std::endl;
        return 1;
    }

    try {
        PipelineConfig config = (argc == 2) ? PipelineConfig::load(argv[1]) : PipelineConfig{};

        PostgresConnection db;
        IngestPipeline pipeline(db, config);
        IngestReport report = pipeline.run();

        std::cout << "\nLoad reports:\n";
        print_load(report.movies);
        print_load(report.ratings);
        print_load(report.people);
        print_load(report.edges);
        std::cout << "Cleaning: " << report.cleaning.summary() << "\n";
        std::cout << "Final row counts:\n";
        for (const auto& [table, rows] : report.final_counts) {
            std::cout << "  " << table << ": " << Logger::count(rows) << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
