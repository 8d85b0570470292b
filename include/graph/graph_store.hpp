/**
 * @file graph_store.hpp
 * @brief Read-only view of the graph store used by the query components
 */

#pragma once

#include <storage/records.hpp>
#include <export.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace SixDegrees {

/**
 * @brief One movie two people both appear in, with each person's role token.
 */
struct SharedCredit {
    MovieId movie_id = 0;
    std::string title;
    std::optional<int64_t> year;
    std::optional<double> average_rating;
    std::optional<int64_t> num_votes;
    std::string role_a;
    std::string role_b;
};

// Interface for graph store queries
class SIXDEGREES_API GraphStore {
public:
    virtual ~GraphStore() = default;

    /// Distinct people sharing at least one movie with `person`, self excluded, ascending.
    virtual std::vector<PersonId> co_stars(PersonId person) = 0;

    virtual std::optional<PersonRecord> find_person(PersonId id) = 0;

    /// Case-insensitive whole-token match of `fragment` against names.
    virtual std::vector<PersonRecord> find_people_by_name(const std::string& fragment) = 0;

    /// (id, title) for the ids that exist, in the order requested.
    virtual std::vector<std::pair<MovieId, std::string>> movie_titles(const std::vector<MovieId>& ids) = 0;

    /// The shared movie with the most votes (unrated last), or nullopt if none.
    virtual std::optional<SharedCredit> shared_credit(PersonId a, PersonId b) = 0;
};

} // namespace SixDegrees
