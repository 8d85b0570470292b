#include <ingestion/field_normalizer.hpp>
#include <utils/errors.hpp>
#include <cerrno>
#include <charconv>
#include <cstdlib>

namespace SixDegrees {

namespace {

bool all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

std::string_view trim(std::string_view s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

int64_t parse_int64(std::string_view digits, std::string_view context) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        throw ParseError("'" + std::string(context) + "' is not a valid integer");
    }
    return value;
}

} // namespace

bool is_null_sentinel(std::string_view raw) {
    return raw == kNullSentinel;
}

std::optional<int64_t> normalize_integer(std::string_view raw) {
    if (is_null_sentinel(raw)) return std::nullopt;

    std::string_view body = raw;
    if (!body.empty() && body.front() == '-') body.remove_prefix(1);
    if (!all_digits(body)) {
        throw ParseError("'" + std::string(raw) + "' is not a valid integer");
    }
    return parse_int64(raw, raw);
}

std::optional<double> normalize_decimal(std::string_view raw) {
    if (is_null_sentinel(raw)) return std::nullopt;
    // strtod would also accept "inf", "nan", hex floats and leading blanks
    char lead = raw.empty() ? '\0' : raw.front();
    bool numeric_lead = (lead >= '0' && lead <= '9') || lead == '-' || lead == '+' || lead == '.';
    if (!numeric_lead || raw.find_first_of("xXnN") != std::string_view::npos) {
        throw ParseError("'" + std::string(raw) + "' is not a valid decimal");
    }

    // strtod needs a terminated buffer; the dump never has long decimals
    std::string buf(raw);
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(buf.c_str(), &end);
    if (end != buf.c_str() + buf.size() || errno == ERANGE) {
        throw ParseError("'" + buf + "' is not a valid decimal");
    }
    return value;
}

std::optional<std::string> normalize_text(std::string_view raw) {
    if (is_null_sentinel(raw)) return std::nullopt;
    return std::string(raw);
}

std::optional<std::string> normalize_category(std::string_view raw) {
    if (is_null_sentinel(raw)) return std::nullopt;
    std::string_view token = trim(raw);
    if (token.empty()) return std::nullopt;
    return std::string(token);
}

int64_t parse_external_id(std::string_view raw, std::string_view prefix) {
    if (raw.size() <= prefix.size() || raw.substr(0, prefix.size()) != prefix) {
        throw ParseError("identifier '" + std::string(raw) + "' does not start with '" +
                         std::string(prefix) + "' followed by digits");
    }
    std::string_view digits = raw.substr(prefix.size());
    if (!all_digits(digits)) {
        throw ParseError("identifier '" + std::string(raw) + "' has a non-numeric suffix");
    }
    return parse_int64(digits, raw);
}

std::vector<int64_t> parse_external_id_list(std::string_view raw, std::string_view prefix) {
    std::vector<int64_t> ids;
    if (is_null_sentinel(raw) || raw.empty()) return ids;

    size_t start = 0;
    while (start <= raw.size()) {
        size_t comma = raw.find(',', start);
        std::string_view item = raw.substr(start, comma == std::string_view::npos ? raw.npos : comma - start);
        item = trim(item);
        if (!item.empty()) {
            ids.push_back(parse_external_id(item, prefix));
        }
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return ids;
}

std::optional<std::string> to_field(const std::optional<int64_t>& value) {
    if (!value) return std::nullopt;
    return std::to_string(*value);
}

std::optional<std::string> to_field(const std::optional<double>& value) {
    if (!value) return std::nullopt;
    // shortest text that parses back to the same double, so 7.1 stays 7.1
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), *value);
    if (ec != std::errc()) {
        throw ParseError("cannot format decimal value");
    }
    return std::string(buf, end);
}

} // namespace SixDegrees
