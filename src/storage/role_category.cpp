#include <storage/role_category.hpp>
#include <stdexcept>

namespace SixDegrees {

std::optional<RoleCategory> parse_role_category(std::string_view token) {
    for (const auto& info : kRoleTable) {
        if (info.token == token) return info.category;
    }
    return std::nullopt;
}

std::string_view role_token(RoleCategory category) {
    auto index = static_cast<size_t>(category);
    if (index >= kRoleTable.size()) {
        throw std::out_of_range("role_token: not a role category");
    }
    return kRoleTable[index].token;
}

std::string_view role_phrase(RoleCategory category) {
    auto index = static_cast<size_t>(category);
    if (index >= kRoleTable.size()) {
        throw std::out_of_range("role_phrase: not a role category");
    }
    return kRoleTable[index].phrase;
}

} // namespace SixDegrees
