/**
 * @file person_resolver.hpp
 * @brief Free-text or numeric input -> one person, a candidate list, or nothing
 */

#pragma once

#include <graph/graph_store.hpp>
#include <export.hpp>
#include <string>
#include <vector>

namespace SixDegrees {

enum class ResolutionKind {
    Exact,
    Ambiguous,
    NotFound
};

struct ResolvedCandidate {
    PersonRecord person;
    std::vector<std::string> known_for_titles;
};

struct SIXDEGREES_API Resolution {
    ResolutionKind kind = ResolutionKind::NotFound;
    std::optional<PersonRecord> person;       // Exact only
    std::vector<PersonRecord> candidates;      // Ambiguous: every match, least notable first
    std::vector<ResolvedCandidate> display;   // candidates with at least one known-for title

    bool exact() const { return kind == ResolutionKind::Exact; }
};

/**
 * @brief Resolves a user-supplied person reference.
 *
 * Input that is all ASCII digits is an id: Exact or NotFound. Anything else
 * is trimmed and matched as a whole name token, case-insensitively. Several
 * matches are Ambiguous, ordered ascending by the length of the raw
 * known-for text (absent counts as empty), so the likeliest intended person
 * comes last. Ties keep id order.
 */
class SIXDEGREES_API PersonResolver {
public:
    explicit PersonResolver(GraphStore& store);

    Resolution resolve(const std::string& input);

    /**
     * @brief Titles of the person's known-for movies that are still in the store.
     */
    std::vector<std::string> known_for_titles(const PersonRecord& person);

    static bool is_id_input(const std::string& input);

private:
    GraphStore& store_;
};

} // namespace SixDegrees
