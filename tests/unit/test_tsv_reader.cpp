/**
 * @file test_tsv_reader.cpp
 * @brief Unit tests for the dump reader and row parsers
 */

#include <gtest/gtest.h>
#include <ingestion/dump_rows.hpp>
#include <ingestion/tsv_reader.hpp>
#include <utils/errors.hpp>
#include <filesystem>
#include <fstream>

using namespace SixDegrees;
namespace fs = std::filesystem;

class TsvReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("sixdegrees_tsv_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& content) {
        auto path = (dir_ / name).string();
        std::ofstream(path, std::ios::binary) << content;
        return path;
    }

    fs::path dir_;
};

TEST_F(TsvReaderTest, ReadsHeaderAndRows) {
    auto path = write("a.tsv", "tconst\taverageRating\tnumVotes\ntt0000001\t5.7\t2000\n\ntt0000002\t\\N\t10\r\n");
    TsvReader reader(path);

    EXPECT_EQ(reader.header().size(), 3u);
    EXPECT_EQ(reader.column("numVotes"), 2u);
    EXPECT_TRUE(reader.has_column("tconst"));
    EXPECT_FALSE(reader.has_column("nconst"));

    TsvRow row;
    ASSERT_TRUE(reader.next(row));
    EXPECT_EQ(row.at(0), "tt0000001");
    EXPECT_EQ(row.line(), 2u);

    ASSERT_TRUE(reader.next(row));
    EXPECT_EQ(row.at(1), "\\N");
    EXPECT_EQ(row.at(2), "10");
    EXPECT_EQ(row.line(), 4u);

    EXPECT_FALSE(reader.next(row));
}

TEST_F(TsvReaderTest, MissingFileIsSchemaError) {
    EXPECT_THROW(TsvReader{(dir_ / "absent.tsv").string()}, SchemaError);
}

TEST_F(TsvReaderTest, EmptyFileHasNoHeader) {
    auto path = write("empty.tsv", "");
    EXPECT_THROW(TsvReader{path}, ParseError);
}

TEST_F(TsvReaderTest, RaggedRowIsFatal) {
    auto path = write("ragged.tsv", "a\tb\n1\t2\t3\n");
    TsvReader reader(path);
    TsvRow row;
    EXPECT_THROW(reader.next(row), ParseError);
}

TEST_F(TsvReaderTest, MissingColumnIsFatal) {
    auto path = write("ratings.tsv", "tconst\tnumVotes\n");
    TsvReader reader(path);
    EXPECT_THROW(RatingColumns::from(reader), ParseError);
}

TEST_F(TsvReaderTest, ParsesMovieRow) {
    auto path = write("title.basics.tsv",
        "tconst\ttitleType\tprimaryTitle\toriginalTitle\tisAdult\tstartYear\tendYear\truntimeMinutes\tgenres\n"
        "tt0087277\tmovie\tFootloose\tFootloose\t0\t1984\t\\N\t107\tDrama,Music,Romance\n"
        "tt0000009\t\\N\tUntitled\tUntitled\t\\N\t\\N\t\\N\t\\N\t\\N\n");
    TsvReader reader(path);
    const auto cols = MovieColumns::from(reader);

    TsvRow row;
    ASSERT_TRUE(reader.next(row));
    MovieRecord m = parse_movie(row, cols);
    EXPECT_EQ(m.id, 87277);
    EXPECT_EQ(m.title, "Footloose");
    EXPECT_EQ(m.year.value(), 1984);
    EXPECT_EQ(m.title_type.value(), "movie");
    EXPECT_EQ(m.is_adult, 0);
    EXPECT_EQ(m.runtime.value(), 107);
    EXPECT_EQ(m.genres.value(), "Drama,Music,Romance");

    ASSERT_TRUE(reader.next(row));
    m = parse_movie(row, cols);
    EXPECT_FALSE(m.title_type.has_value());
    EXPECT_EQ(m.is_adult, 0);
    EXPECT_FALSE(m.year.has_value());
    EXPECT_FALSE(m.genres.has_value());
}

TEST_F(TsvReaderTest, ParseErrorNamesTheLine) {
    auto path = write("name.basics.tsv",
        "nconst\tprimaryName\tbirthYear\tdeathYear\tprimaryProfession\tknownForTitles\n"
        "nm0000102\tKevin Bacon\t1958\t\\N\tactor\ttt0087277\n"
        "nmX\tBroken\t\\N\t\\N\t\\N\t\\N\n");
    TsvReader reader(path);
    const auto cols = PersonColumns::from(reader);

    TsvRow row;
    ASSERT_TRUE(reader.next(row));
    PersonRecord p = parse_person(row, cols);
    EXPECT_EQ(p.id, 102);
    EXPECT_EQ(p.birth.value(), 1958);
    EXPECT_FALSE(p.death.has_value());

    ASSERT_TRUE(reader.next(row));
    try {
        parse_person(row, cols);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.detail().rfind("line 3: ", 0), 0u) << e.what();
    }
}

TEST_F(TsvReaderTest, ParsesEdgeRow) {
    auto path = write("title.principals.tsv",
        "tconst\tordering\tnconst\tcategory\tjob\tcharacters\n"
        "tt0087277\t1\tnm0000102\tactor\t\\N\t[\"Ren\"]\n");
    TsvReader reader(path);
    const auto cols = EdgeColumns::from(reader);

    TsvRow row;
    ASSERT_TRUE(reader.next(row));
    EdgeRow e = parse_edge(row, cols);
    EXPECT_EQ(e.person_id, 102);
    EXPECT_EQ(e.movie_id, 87277);
    EXPECT_EQ(e.category.value(), "actor");
}
