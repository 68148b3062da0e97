#pragma once

#include <map>
#include <optional>
#include <string>

namespace vault::intake {

/**
 * @brief Known contributor tokens and their display names
 *
 * Loaded once from configuration; read-only afterwards, so concurrent
 * lookups need no lock.
 */
class ContributorRegistry {
public:
    ContributorRegistry() = default;
    explicit ContributorRegistry(std::map<std::string, std::string> names);

    bool is_valid(const std::string& token) const;
    std::optional<std::string> display_name(const std::string& token) const;

    std::size_t size() const { return names_.size(); }

private:
    std::map<std::string, std::string> names_;
};

} // namespace vault::intake
