/**
 * @file test_path_hydrator.cpp
 * @brief Unit tests for turning a person path into readable links
 */

#include <gtest/gtest.h>
#include <graph/path_hydrator.hpp>
#include "memory_graph_store.hpp"
#include <stdexcept>

using namespace SixDegrees;
using SixDegrees::Testing::MemoryGraphStore;

TEST(PathHydratorTest, SentenceFormat) {
    EXPECT_EQ(PathHydrator::sentence("Kevin Bacon", "actor", "Lori Singer", "actress",
                                     "Footloose", 1984),
              "Kevin Bacon was an actor in Footloose (1984) where Lori Singer was an actress.");
    EXPECT_EQ(PathHydrator::sentence("A", "self", "B", "director", "Doc", std::nullopt),
              "A were themselves in Doc where B was a director.");
}

TEST(PathHydratorTest, UnknownRoleIsRejected) {
    EXPECT_THROW(PathHydrator::sentence("A", "grip", "B", "actor", "T", 2000), std::runtime_error);
}

TEST(PathHydratorTest, PicksMostVotedSharedMovie) {
    MemoryGraphStore store;
    store.person(1, "Kevin Bacon").person(2, "Lori Singer").person(3, "John Lithgow");
    store.movie(10, "Obscure Short", 1990, 25)
         .movie(11, "Footloose", 1984, 250000)
         .movie(12, "Unrated", std::nullopt, std::nullopt);
    store.edge(1, 10, "actor").edge(2, 10, "actress");
    store.edge(1, 11, "actor").edge(2, 11, "actress");
    store.edge(1, 12, "actor").edge(2, 12, "actress");
    store.edge(3, 11, "actor");

    PathHydrator hydrator(store);
    auto links = hydrator.describe({3, 2, 1});
    ASSERT_EQ(links.size(), 2u);

    EXPECT_EQ(links[0].movie.movie_id, 11);
    EXPECT_EQ(links[0].from.name, "John Lithgow");
    EXPECT_EQ(links[0].to.name, "Lori Singer");

    EXPECT_EQ(links[1].movie.title, "Footloose");
    EXPECT_EQ(links[1].sentence,
              "Lori Singer was an actress in Footloose (1984) where Kevin Bacon was an actor.");
}

TEST(PathHydratorTest, SinglePersonHasNoLinks) {
    MemoryGraphStore store;
    store.person(1, "Solo");
    PathHydrator hydrator(store);
    EXPECT_TRUE(hydrator.describe({1}).empty());
    EXPECT_TRUE(hydrator.describe({}).empty());
}

TEST(PathHydratorTest, BrokenWalkThrows) {
    MemoryGraphStore store;
    store.person(1, "A").person(2, "B");
    store.movie(10, "M").edge(1, 10);

    PathHydrator hydrator(store);
    EXPECT_THROW(hydrator.describe({1, 2}), std::runtime_error);
    EXPECT_THROW(hydrator.describe({1, 99}), std::runtime_error);
}
