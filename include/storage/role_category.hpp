/**
 * @file role_category.hpp
 * @brief Closed set of credit categories carried by appearance edges
 */

#pragma once

#include <export.hpp>
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace SixDegrees {

enum class RoleCategory {
    Actor,
    Actress,
    Self,
    Director,
    Writer,
    Producer,
    Composer,
    Cinematographer,
    Editor,
    ProductionDesigner,
    CastingDirector,
    ArchiveFootage,
    ArchiveSound,
    Count
};

struct RoleInfo {
    RoleCategory category;
    std::string_view token;   // as spelled in the dataset
    std::string_view phrase;  // "<name> <phrase> in <title>"
};

inline constexpr size_t kRoleCategoryCount = static_cast<size_t>(RoleCategory::Count);

// Indexed by RoleCategory; role_table_is_complete() below checks the order.
inline constexpr std::array<RoleInfo, kRoleCategoryCount> kRoleTable{{
    {RoleCategory::Actor,              "actor",               "was an actor"},
    {RoleCategory::Actress,            "actress",             "was an actress"},
    {RoleCategory::Self,               "self",                "were themselves"},
    {RoleCategory::Director,           "director",            "was a director"},
    {RoleCategory::Writer,             "writer",              "was a writer"},
    {RoleCategory::Producer,           "producer",            "was a producer"},
    {RoleCategory::Composer,           "composer",            "was a composer"},
    {RoleCategory::Cinematographer,    "cinematographer",     "was a cinematographer"},
    {RoleCategory::Editor,             "editor",              "was an editor"},
    {RoleCategory::ProductionDesigner, "production_designer", "was a production designer"},
    {RoleCategory::CastingDirector,    "casting_director",    "was a casting director"},
    {RoleCategory::ArchiveFootage,     "archive_footage",     "was present in archive footage"},
    {RoleCategory::ArchiveSound,       "archive_sound",       "was in archive sound"},
}};

constexpr bool role_table_is_complete() {
    for (size_t i = 0; i < kRoleTable.size(); ++i) {
        if (static_cast<size_t>(kRoleTable[i].category) != i) return false;
        if (kRoleTable[i].token.empty() || kRoleTable[i].phrase.empty()) return false;
    }
    return true;
}

static_assert(role_table_is_complete(),
              "kRoleTable must list every RoleCategory once, in declaration order");

/**
 * @brief Map a dataset token ("actor", "archive_footage", ...) to its category.
 *
 * Unknown tokens return nullopt; callers treat that as dataset drift.
 */
SIXDEGREES_API std::optional<RoleCategory> parse_role_category(std::string_view token);

SIXDEGREES_API std::string_view role_token(RoleCategory category);
SIXDEGREES_API std::string_view role_phrase(RoleCategory category);

} // namespace SixDegrees
