#ifndef REPO_OPTIONS_HPP
#define REPO_OPTIONS_HPP

#include <chrono>
#include <optional>

/// Settings given for one repository under the `repositories` config key.
struct RepoOptions {
    std::optional<bool> exclude;                     ///< Drop the repository from the session
    std::optional<std::chrono::milliseconds> timeout; ///< Deadline for its git operations
};

#endif // REPO_OPTIONS_HPP
