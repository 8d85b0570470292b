#include <graph/person_resolver.hpp>
#include <graph/name_match.hpp>
#include <ingestion/field_normalizer.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace SixDegrees {

namespace {

size_t known_for_length(const PersonRecord& p) {
    return p.known_for ? p.known_for->size() : 0;
}

} // anonymous namespace

PersonResolver::PersonResolver(GraphStore& store) : store_(store) {}

bool PersonResolver::is_id_input(const std::string& input) {
    if (input.empty()) return false;
    return std::all_of(input.begin(), input.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::vector<std::string> PersonResolver::known_for_titles(const PersonRecord& person) {
    std::vector<std::string> titles;
    if (!person.known_for) return titles;

    const auto ids = parse_external_id_list(*person.known_for, kMoviePrefix);
    for (auto& [id, title] : store_.movie_titles(ids)) {
        titles.push_back(std::move(title));
    }
    return titles;
}

Resolution PersonResolver::resolve(const std::string& input) {
    Resolution result;
    const std::string text = trim_copy(input);
    if (text.empty()) return result;

    if (is_id_input(text)) {
        PersonId id = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
        if (ec != std::errc() || end != text.data() + text.size()) return result;  // out of range
        if (auto person = store_.find_person(id)) {
            result.kind = ResolutionKind::Exact;
            result.person = std::move(person);
        }
        return result;
    }

    auto matches = store_.find_people_by_name(text);
    if (matches.empty()) return result;

    if (matches.size() == 1) {
        result.kind = ResolutionKind::Exact;
        result.person = std::move(matches.front());
        return result;
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const PersonRecord& a, const PersonRecord& b) {
                         return known_for_length(a) < known_for_length(b);
                     });

    result.kind = ResolutionKind::Ambiguous;
    for (const auto& person : matches) {
        auto titles = known_for_titles(person);
        if (!titles.empty()) {
            result.display.push_back({person, std::move(titles)});
        }
    }
    result.candidates = std::move(matches);
    return result;
}

} // namespace SixDegrees
