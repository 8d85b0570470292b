#include <graph/name_match.hpp>
#include <cctype>

namespace SixDegrees {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool equals_ignore_case(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::string trim_copy(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
    return std::string(text.substr(begin, end - begin));
}

bool matches_name_token(std::string_view name, std::string_view fragment) {
    if (fragment.empty() || fragment.size() > name.size()) return false;

    for (size_t pos = 0; pos + fragment.size() <= name.size(); ++pos) {
        if (pos > 0 && !is_space(name[pos - 1])) continue;
        const size_t after = pos + fragment.size();
        if (after < name.size() && !is_space(name[after])) continue;
        if (equals_ignore_case(name.substr(pos, fragment.size()), fragment)) return true;
    }
    return false;
}

std::string name_token_pattern(std::string_view fragment) {
    static const std::string_view meta = "\\^$.|?*+()[]{}";

    std::string out = "(^|\\s)";
    for (char c : fragment) {
        if (meta.find(c) != std::string_view::npos) out.push_back('\\');
        out.push_back(c);
    }
    out += "($|\\s)";
    return out;
}

} // namespace SixDegrees
