/**
 * @file path_hydrator.hpp
 * @brief Person-id path -> people, shared movies and readable sentences
 */

#pragma once

#include <graph/graph_store.hpp>
#include <export.hpp>
#include <string>
#include <vector>

namespace SixDegrees {

// One hop of a path: two people and the movie that connects them.
struct PathLink {
    PersonRecord from;
    PersonRecord to;
    SharedCredit movie;
    std::string sentence;
};

class SIXDEGREES_API PathHydrator {
public:
    explicit PathHydrator(GraphStore& store);

    /**
     * @brief One PathLink per consecutive pair of the path.
     *
     * The connecting movie is the shared one with the most votes. Throws
     * std::runtime_error when a person is missing or a pair shares no movie,
     * since the path is then not a walk over the current store.
     */
    std::vector<PathLink> describe(const std::vector<PersonId>& path);

    /**
     * @brief "Kevin Bacon was an actor in Footloose (1984) where Lori Singer was an actress."
     *
     * The parenthesized year is omitted when unknown. Role tokens are dataset
     * tokens ("actor", "self", ...).
     */
    static std::string sentence(const std::string& name_a, const std::string& role_a,
                                const std::string& name_b, const std::string& role_b,
                                const std::string& title, const std::optional<int64_t>& year);

private:
    PersonRecord require_person(PersonId id);

    GraphStore& store_;
};

} // namespace SixDegrees
