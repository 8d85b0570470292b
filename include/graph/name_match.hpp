#pragma once

#include <export.hpp>
#include <string>
#include <string_view>

namespace SixDegrees {

// Whole-token name matching. A fragment matches a name when it occurs
// case-insensitively and is bounded on both sides by whitespace or the ends
// of the name: "bacon" matches "Kevin Bacon" but not "Baconsfield".

SIXDEGREES_API bool matches_name_token(std::string_view name, std::string_view fragment);

/**
 * @brief Same rule as a PostgreSQL regular expression for `~*`.
 *
 * Every regex metacharacter in the fragment is escaped, so "J. (Jr)" is
 * matched literally.
 */
SIXDEGREES_API std::string name_token_pattern(std::string_view fragment);

// Leading and trailing whitespace removed
SIXDEGREES_API std::string trim_copy(std::string_view text);

} // namespace SixDegrees
