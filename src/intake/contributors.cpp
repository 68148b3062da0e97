#include "vault/intake/contributors.hpp"

namespace vault::intake {

ContributorRegistry::ContributorRegistry(std::map<std::string, std::string> names)
    : names_(std::move(names)) {
}

bool ContributorRegistry::is_valid(const std::string& token) const {
    return !token.empty() && names_.find(token) != names_.end();
}

std::optional<std::string> ContributorRegistry::display_name(const std::string& token) const {
    auto it = names_.find(token);
    if (it == names_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace vault::intake
