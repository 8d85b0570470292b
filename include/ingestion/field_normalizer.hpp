/**
 * @file field_normalizer.hpp
 * @brief Raw dump field -> typed optional value
 *
 * The dump marks an absent value with the two-character token \N. Anything
 * else in a numeric column must parse completely; a stray character means
 * the dump is not in the format this loader understands, so it is a
 * ParseError rather than a silent NULL.
 */

#pragma once

#include <export.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace SixDegrees {

inline constexpr std::string_view kNullSentinel = "\\N";

inline constexpr std::string_view kMoviePrefix = "tt";
inline constexpr std::string_view kPersonPrefix = "nm";

SIXDEGREES_API bool is_null_sentinel(std::string_view raw);

SIXDEGREES_API std::optional<int64_t> normalize_integer(std::string_view raw);
SIXDEGREES_API std::optional<double> normalize_decimal(std::string_view raw);
SIXDEGREES_API std::optional<std::string> normalize_text(std::string_view raw);

/**
 * @brief Category values are short tokens (titleType, category); surrounding
 * whitespace is dropped and an empty token counts as absent.
 */
SIXDEGREES_API std::optional<std::string> normalize_category(std::string_view raw);

/**
 * @brief Derive the numeric id from an external identifier.
 *
 * "tt0087277" with prefix "tt" -> 87277. The remainder after the prefix must
 * be one or more ASCII digits; leading zeros are dropped by the integer parse.
 * Throws ParseError for a wrong prefix, a non-digit remainder or overflow.
 */
SIXDEGREES_API int64_t parse_external_id(std::string_view raw, std::string_view prefix);

/**
 * @brief Split a comma-separated list of external ids and parse each one.
 */
SIXDEGREES_API std::vector<int64_t> parse_external_id_list(std::string_view raw, std::string_view prefix);

/**
 * @brief Render an optional value for BulkCopy (nullopt stays NULL).
 */
SIXDEGREES_API std::optional<std::string> to_field(const std::optional<int64_t>& value);
SIXDEGREES_API std::optional<std::string> to_field(const std::optional<double>& value);

} // namespace SixDegrees
