/**
 * @file test_person_resolver.cpp
 * @brief Unit tests for person resolution and whole-token name matching
 */

#include <gtest/gtest.h>
#include <graph/name_match.hpp>
#include <graph/person_resolver.hpp>
#include "memory_graph_store.hpp"

using namespace SixDegrees;
using SixDegrees::Testing::MemoryGraphStore;

namespace {

// Three "Smith"s with known-for lists of 0, 2 and 5 titles
MemoryGraphStore smiths() {
    MemoryGraphStore store;
    store.movie(1, "One").movie(2, "Two").movie(3, "Three").movie(4, "Four").movie(5, "Five");
    store.person(10, "Will Smith", std::string("tt0000001,tt0000002,tt0000003,tt0000004,tt0000005"), 1968);
    store.person(11, "Maggie Smith", std::nullopt, 1934);
    store.person(12, "Kevin Smith", std::string("tt0000001,tt0000002"), 1970);
    store.person(20, "Kevin Bacon", std::string("tt0000003"), 1958);
    store.person(21, "Jaden Smithson");
    return store;
}

} // anonymous namespace

TEST(NameMatchTest, WholeTokenOnly) {
    EXPECT_TRUE(matches_name_token("Kevin Bacon", "bacon"));
    EXPECT_TRUE(matches_name_token("Kevin Bacon", "KEVIN"));
    EXPECT_TRUE(matches_name_token("Kevin Bacon", "kevin bacon"));
    EXPECT_FALSE(matches_name_token("Kevin Bacon", "bac"));
    EXPECT_FALSE(matches_name_token("Kevin Bacon", "in Ba"));
    EXPECT_FALSE(matches_name_token("Jaden Smithson", "smith"));
    EXPECT_FALSE(matches_name_token("Kevin Bacon", ""));
}

TEST(NameMatchTest, PatternEscapesMetacharacters) {
    EXPECT_EQ(name_token_pattern("bacon"), "(^|\\s)bacon($|\\s)");
    EXPECT_EQ(name_token_pattern("J. (Jr)"), "(^|\\s)J\\. \\(Jr\\)($|\\s)");
    EXPECT_EQ(name_token_pattern("a+b*"), "(^|\\s)a\\+b\\*($|\\s)");
}

TEST(NameMatchTest, TrimCopy) {
    EXPECT_EQ(trim_copy("  Kevin Bacon\t"), "Kevin Bacon");
    EXPECT_EQ(trim_copy("   "), "");
}

TEST(PersonResolverTest, NumericInputIsId) {
    auto store = smiths();
    PersonResolver resolver(store);

    auto r = resolver.resolve("20");
    ASSERT_TRUE(r.exact());
    EXPECT_EQ(r.person->name, "Kevin Bacon");

    EXPECT_EQ(resolver.resolve("999").kind, ResolutionKind::NotFound);
    EXPECT_EQ(resolver.resolve("99999999999999999999999").kind, ResolutionKind::NotFound);
}

TEST(PersonResolverTest, SingleNameMatchIsExact) {
    auto store = smiths();
    PersonResolver resolver(store);

    auto r = resolver.resolve("  bacon ");
    ASSERT_TRUE(r.exact());
    EXPECT_EQ(r.person->id, 20);
}

TEST(PersonResolverTest, NoMatchOrEmptyIsNotFound) {
    auto store = smiths();
    PersonResolver resolver(store);

    EXPECT_EQ(resolver.resolve("Streep").kind, ResolutionKind::NotFound);
    EXPECT_EQ(resolver.resolve("   ").kind, ResolutionKind::NotFound);
    EXPECT_EQ(resolver.resolve("").kind, ResolutionKind::NotFound);
    EXPECT_EQ(resolver.resolve("Smi").kind, ResolutionKind::NotFound);
}

TEST(PersonResolverTest, AmbiguousOrderedByKnownForLength) {
    auto store = smiths();
    PersonResolver resolver(store);

    auto r = resolver.resolve("smith");
    ASSERT_EQ(r.kind, ResolutionKind::Ambiguous);
    EXPECT_FALSE(r.person.has_value());

    // Full match set keeps the person with no known-for titles
    ASSERT_EQ(r.candidates.size(), 3u);
    EXPECT_EQ(r.candidates[0].id, 11);
    EXPECT_EQ(r.candidates[1].id, 12);
    EXPECT_EQ(r.candidates[2].id, 10);

    // Display list drops them; 2-title person before 5-title person
    ASSERT_EQ(r.display.size(), 2u);
    EXPECT_EQ(r.display[0].person.id, 12);
    EXPECT_EQ(r.display[1].person.id, 10);
    EXPECT_EQ(r.display[0].known_for_titles, (std::vector<std::string>{"One", "Two"}));
    EXPECT_EQ(r.display[1].known_for_titles.size(), 5u);
}

TEST(PersonResolverTest, UndisplayedCandidateStillResolvableById) {
    auto store = smiths();
    PersonResolver resolver(store);

    auto r = resolver.resolve("11");
    ASSERT_TRUE(r.exact());
    EXPECT_EQ(r.person->name, "Maggie Smith");

    r = resolver.resolve("Maggie Smith");
    ASSERT_TRUE(r.exact());
    EXPECT_EQ(r.person->id, 11);
}

TEST(PersonResolverTest, KnownForSkipsDeletedMovies) {
    MemoryGraphStore store;
    store.movie(3, "Three");
    store.person(1, "Someone", std::string("tt0000001,tt0000003,tt0000002"));

    PersonResolver resolver(store);
    auto titles = resolver.known_for_titles(*store.find_person(1));
    EXPECT_EQ(titles, (std::vector<std::string>{"Three"}));
}
