#include <graph/path_hydrator.hpp>
#include <storage/role_category.hpp>
#include <stdexcept>

namespace SixDegrees {

namespace {

std::string phrase_for(const std::string& token) {
    auto category = parse_role_category(token);
    if (!category) {
        throw std::runtime_error("edge carries unknown role category '" + token + "'");
    }
    return std::string(role_phrase(*category));
}

} // anonymous namespace

PathHydrator::PathHydrator(GraphStore& store) : store_(store) {}

std::string PathHydrator::sentence(const std::string& name_a, const std::string& role_a,
                                   const std::string& name_b, const std::string& role_b,
                                   const std::string& title, const std::optional<int64_t>& year) {
    std::string out = name_a + " " + phrase_for(role_a) + " in " + title;
    if (year) out += " (" + std::to_string(*year) + ")";
    out += " where " + name_b + " " + phrase_for(role_b) + ".";
    return out;
}

PersonRecord PathHydrator::require_person(PersonId id) {
    auto person = store_.find_person(id);
    if (!person) {
        throw std::runtime_error("person " + std::to_string(id) + " on path is not in the store");
    }
    return *person;
}

std::vector<PathLink> PathHydrator::describe(const std::vector<PersonId>& path) {
    std::vector<PathLink> links;
    if (path.size() < 2) return links;

    links.reserve(path.size() - 1);
    PersonRecord from = require_person(path.front());
    for (size_t i = 1; i < path.size(); ++i) {
        PersonRecord to = require_person(path[i]);

        auto credit = store_.shared_credit(from.id, to.id);
        if (!credit) {
            throw std::runtime_error("people " + std::to_string(from.id) + " and " +
                                     std::to_string(to.id) + " share no movie");
        }

        PathLink link;
        link.sentence = sentence(from.name, credit->role_a, to.name, credit->role_b,
                                 credit->title, credit->year);
        link.movie = std::move(*credit);
        link.from = from;
        link.to = to;
        links.push_back(std::move(link));

        from = std::move(to);
    }
    return links;
}

} // namespace SixDegrees
