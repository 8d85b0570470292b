/**
 * @file test_ingest_pipeline.cpp
 * @brief Full rebuild against a live PostgreSQL database from fixture dumps
 *
 * Connects to SIXDEGREES_TEST_CONNINFO when set, otherwise to the PG*
 * environment with the database forced to sixdegrees_test. The four graph
 * tables in that database are dropped and rebuilt. Skipped when no server
 * is reachable.
 */

#include <gtest/gtest.h>
#include <config/pipeline_config.hpp>
#include <database/postgres_connection.hpp>
#include <graph/path_hydrator.hpp>
#include <graph/path_resolver.hpp>
#include <graph/person_resolver.hpp>
#include <graph/postgres_graph_store.hpp>
#include <ingestion/cleaning_stage.hpp>
#include <ingestion/index_builder.hpp>
#include <ingestion/ingest_pipeline.hpp>
#include <storage/schema.hpp>
#include <utils/errors.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>

using namespace SixDegrees;
namespace fs = std::filesystem;

namespace {

constexpr PersonId kAlice = 1;
constexpr PersonId kBob = 2;
constexpr PersonId kCarol = 3;
constexpr PersonId kDan = 4;

const char* kMovies =
    "tconst\ttitleType\tprimaryTitle\toriginalTitle\tisAdult\tstartYear\tendYear\truntimeMinutes\tgenres\n"
    "tt0000001\tmovie\tFirst Meeting\tFirst Meeting\t0\t2000\t\\N\t95\tDrama\n"
    "tt0000002\tmovie\tSecond Act\tSecond Act\t0\t2001\t\\N\t100\tComedy\n"
    "tt0000003\tmovie\tAfter Hours\tAfter Hours\t1\t2002\t\\N\t80\tDrama\n"
    "tt0000004\ttvEpisode\tPilot\tPilot\t0\t2003\t\\N\t22\tComedy\n"
    "tt0000005\tmovie\tUnseen\tUnseen\t0\t2004\t\\N\t90\tDrama\n"
    "tt0000006\tmovie\tNever Rated\tNever Rated\t0\t2005\t\\N\t90\tDrama\n"
    "tt0000007\tmovie\tEvening Report\tEvening Report\t0\t2006\t\\N\t60\tDocumentary,News\n"
    "tt0000008\t\\N\tMystery Type\tMystery Type\t\\N\t\\N\t\\N\t\\N\t\\N\n"
    "tt0000009\tmovie\tFar Away\tFar Away\t0\t2010\t\\N\t120\tDrama\n"
    "tt0000010\tmovie\tReal Lives\tReal Lives\t0\t1999\t\\N\t90\tDrama,Reality\n";

const char* kRatings =
    "tconst\taverageRating\tnumVotes\n"
    "tt0000001\t7.0\t100\n"
    "tt0000002\t6.0\t50\n"
    "tt0000003\t5.0\t100\n"
    "tt0000004\t8.0\t100\n"
    "tt0000005\t6.0\t5\n"
    "tt0000007\t5.0\t100\n"
    "tt0000008\t7.0\t100\n"
    "tt0000009\t8.0\t1000\n"
    "tt0000010\t6.5\t100\n"
    "tt0000099\t5.0\t100\n";

const char* kPeople =
    "nconst\tprimaryName\tbirthYear\tdeathYear\tprimaryProfession\tknownForTitles\n"
    "nm0000001\tAlice Adams\t1970\t\\N\tactress\ttt0000001\n"
    "nm0000002\tBob Brown\t1965\t\\N\tactor,director\ttt0000001,tt0000002\n"
    "nm0000003\tCarol Clark\t1980\t\\N\tactress\ttt0000002\n"
    "nm0000004\tDan Dale\t\\N\t\\N\tactor\ttt0000009\n"
    "nm0000005\tEve Evans\t1990\t\\N\tactress\ttt0000009\n"
    "nm0000006\tOscar Only\t1950\t2010\tactor\ttt0000003\n"
    "nm0000007\tNora None\t\\N\t\\N\t\\N\t\\N\n";

const char* kEdges =
    "tconst\tordering\tnconst\tcategory\tjob\tcharacters\n"
    "tt0000001\t1\tnm0000001\tactress\t\\N\t\\N\n"
    "tt0000001\t2\tnm0000002\tactor\t\\N\t\\N\n"
    "tt0000001\t3\tnm0000002\tdirector\t\\N\t\\N\n"
    "tt0000002\t1\tnm0000002\tactor\t\\N\t\\N\n"
    "tt0000002\t2\tnm0000003\tactress\t\\N\t\\N\n"
    "tt0000003\t1\tnm0000006\tactor\t\\N\t\\N\n"
    "tt0000004\t1\tnm0000006\tself\t\\N\t\\N\n"
    "tt0000005\t1\tnm0000001\tactress\t\\N\t\\N\n"
    "tt0000005\t2\tnm0000003\tactress\t\\N\t\\N\n"
    "tt0000009\t1\tnm0000004\tactor\t\\N\t\\N\n"
    "tt0000009\t2\tnm0000005\tactress\t\\N\t\\N\n"
    "tt0000001\t4\tnm0000099\tactor\t\\N\t\\N\n"
    "tt0000099\t1\tnm0000001\tactress\t\\N\t\\N\n"
    "tt0000002\t3\tnm0000004\tstunts\t\\N\t\\N\n"
    "tt0000007\t1\tnm0000001\tself\t\\N\t\\N\n";

std::string test_conninfo() {
    if (const char* explicit_conninfo = std::getenv("SIXDEGREES_TEST_CONNINFO")) {
        return explicit_conninfo;
    }
    // A later keyword overrides the earlier one
    return PostgresConnection::conninfo_from_env() + " dbname=sixdegrees_test";
}

} // anonymous namespace

class IngestPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        try {
            db_ = std::make_unique<PostgresConnection>(test_conninfo());
        } catch (const std::exception& e) {
            GTEST_SKIP() << "Database not available - skipping integration test: " << e.what();
        }

        dir_ = fs::temp_directory_path() /
               ("sixdegrees_fixture_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
        write("title.basics.tsv", kMovies);
        write("title.ratings.tsv", kRatings);
        write("name.basics.tsv", kPeople);
        write("title.principals.tsv", kEdges);

        config_.data_dir = dir_.string();
        config_.batch_size = 4;
    }

    void TearDown() override {
        std::error_code ec;
        if (!dir_.empty()) fs::remove_all(dir_, ec);
    }

    void write(const std::string& name, const char* content) {
        std::ofstream out(dir_ / name, std::ios::binary);
        out << content;
    }

    size_t scalar(const std::string& sql) {
        auto v = db_->query_single(sql);
        return v ? static_cast<size_t>(std::stoull(*v)) : 0;
    }

    std::unique_ptr<PostgresConnection> db_;
    fs::path dir_;
    PipelineConfig config_;
};

TEST_F(IngestPipelineTest, LoadReportsCountSkipsAndDuplicates) {
    IngestReport report = IngestPipeline(*db_, config_).run();

    EXPECT_EQ(report.movies.rows_read, 10u);
    EXPECT_EQ(report.movies.rows_inserted, 10u);

    EXPECT_EQ(report.ratings.rows_read, 10u);
    EXPECT_EQ(report.ratings.rows_inserted, 9u);
    EXPECT_EQ(report.ratings.skipped_missing_movie, 1u);

    EXPECT_EQ(report.people.rows_inserted, 7u);

    EXPECT_EQ(report.edges.rows_read, 15u);
    EXPECT_EQ(report.edges.skipped_missing_person, 1u);
    EXPECT_EQ(report.edges.skipped_missing_movie, 1u);
    EXPECT_EQ(report.edges.skipped_unknown_role, 1u);
    EXPECT_EQ(report.edges.duplicates, 1u);
    EXPECT_EQ(report.edges.rows_inserted, 11u);
    EXPECT_EQ(report.edges.batches, 3u);
}

TEST_F(IngestPipelineTest, CleaningAppliesEveryRule) {
    IngestReport report = IngestPipeline(*db_, config_).run();
    const CleaningReport& c = report.cleaning;

    EXPECT_EQ(c.adult_movies, 1u);
    EXPECT_EQ(c.title_type_movies, 2u);
    EXPECT_EQ(c.low_vote_movies, 2u);
    EXPECT_EQ(c.excluded_genre_movies, 1u);
    EXPECT_EQ(c.cascaded_edges, 5u);
    EXPECT_EQ(c.cascaded_ratings, 5u);
    EXPECT_EQ(c.orphaned_people, 2u);

    EXPECT_EQ(report.final_counts.at("movies"), 4u);
    EXPECT_EQ(report.final_counts.at("ratings"), 4u);
    EXPECT_EQ(report.final_counts.at("people"), 5u);
    EXPECT_EQ(report.final_counts.at("edges"), 6u);
}

TEST_F(IngestPipelineTest, NoDanglingReferencesSurvive) {
    IngestPipeline(*db_, config_).run();

    EXPECT_EQ(scalar("SELECT count(*) FROM edges e WHERE NOT EXISTS "
                     "(SELECT 1 FROM people p WHERE p.id = e.person_id)"), 0u);
    EXPECT_EQ(scalar("SELECT count(*) FROM edges e WHERE NOT EXISTS "
                     "(SELECT 1 FROM movies m WHERE m.id = e.movie_id)"), 0u);
    EXPECT_EQ(scalar("SELECT count(*) FROM ratings r WHERE NOT EXISTS "
                     "(SELECT 1 FROM movies m WHERE m.id = r.movie_id)"), 0u);
    EXPECT_EQ(scalar("SELECT count(*) FROM people p WHERE NOT EXISTS "
                     "(SELECT 1 FROM edges e WHERE e.person_id = p.id)"), 0u);
}

TEST_F(IngestPipelineTest, CleaningAndIndexingAreIdempotent) {
    IngestReport first = IngestPipeline(*db_, config_).run();
    EXPECT_EQ(first.indexes.created.size(), 3u);

    CleaningReport again = CleaningStage(*db_, config_.cleaning).run();
    EXPECT_EQ(again.rows_deleted(), 0u);

    IndexReport indexes = IndexBuilder(*db_).build();
    EXPECT_TRUE(indexes.created.empty());
    EXPECT_EQ(indexes.existing.size(), 3u);
}

TEST_F(IngestPipelineTest, ShortestPathsOverCleanedStore) {
    IngestPipeline(*db_, config_).run();
    Schema::require_tables(*db_);

    PostgresGraphStore store(*db_);
    PathResolver paths(store);

    auto ac = paths.find(kAlice, kCarol);
    ASSERT_TRUE(ac.found());
    EXPECT_EQ(ac.path, (std::vector<PersonId>{kAlice, kBob, kCarol}));

    auto ab = paths.find(kAlice, kBob);
    ASSERT_TRUE(ab.found());
    EXPECT_EQ(ab.path, (std::vector<PersonId>{kAlice, kBob}));

    PathConfig roomy;
    roomy.max_nodes = 100;
    EXPECT_EQ(paths.find(kAlice, kDan, roomy).status, PathStatus::NoPath);

    PathConfig tight;
    tight.max_nodes = 2;
    EXPECT_THROW(paths.find(kAlice, kDan, tight), SearchAborted);

    auto links = PathHydrator(store).describe(ac.path);
    ASSERT_EQ(links.size(), 2u);
    EXPECT_EQ(links[0].movie.title, "First Meeting");
    EXPECT_EQ(links[1].sentence,
              "Bob Brown was an actor in Second Act (2001) where Carol Clark was an actress.");
}

TEST_F(IngestPipelineTest, ResolvesPeopleByIdAndName) {
    IngestPipeline(*db_, config_).run();

    PostgresGraphStore store(*db_);
    PersonResolver resolver(store);

    auto by_id = resolver.resolve("3");
    ASSERT_TRUE(by_id.exact());
    EXPECT_EQ(by_id.person->name, "Carol Clark");

    auto by_name = resolver.resolve("  adams ");
    ASSERT_TRUE(by_name.exact());
    EXPECT_EQ(by_name.person->id, kAlice);

    EXPECT_EQ(resolver.resolve("Ada").kind, ResolutionKind::NotFound);
    EXPECT_EQ(resolver.resolve("Nora").kind, ResolutionKind::NotFound);  // removed as isolated
    EXPECT_EQ(resolver.resolve("(").kind, ResolutionKind::NotFound);

    EXPECT_EQ(resolver.known_for_titles(*by_name.person), (std::vector<std::string>{"First Meeting"}));
}

TEST_F(IngestPipelineTest, RebuildIsRepeatable) {
    IngestReport first = IngestPipeline(*db_, config_).run();
    PostgresGraphStore store(*db_);
    auto path_first = PathResolver(store).find(kAlice, kCarol).path;

    IngestReport second = IngestPipeline(*db_, config_).run();
    auto path_second = PathResolver(store).find(kAlice, kCarol).path;

    EXPECT_EQ(first.final_counts, second.final_counts);
    EXPECT_EQ(path_first, path_second);
}

TEST_F(IngestPipelineTest, MissingDumpFailsBeforeDropping) {
    IngestPipeline(*db_, config_).run();
    fs::remove(dir_ / "title.principals.tsv");

    EXPECT_THROW(IngestPipeline(*db_, config_).run(), SchemaError);
    EXPECT_NO_THROW(Schema::require_tables(*db_));
    EXPECT_EQ(Schema::row_count(*db_, Table::Edges), 6u);
}

TEST_F(IngestPipelineTest, SkipThresholdFailsLoad) {
    config_.max_skip_ratio = 0.1;  // ratings skip 1 of 10, edges 3 of 15
    EXPECT_THROW(IngestPipeline(*db_, config_).run(), LoadError);
}
