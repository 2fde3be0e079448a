// options/repo_settings.cpp
//
// Parse per-repository settings from the `repositories` config key.

#include <map>
#include <stdexcept>
#include <string>

#include "options.hpp"
#include "parse_utils.hpp"
#include "scanner.hpp"

void parse_repo_settings(Options& opts,
                         const std::map<std::string, std::map<std::string, std::string>>&
                             cfg_repo_opts) {
    for (const auto& [repo, values] : cfg_repo_opts) {
        RepoOptions ro;
        auto ropt = [&](const std::string& k) {
            auto it = values.find(k);
            if (it != values.end())
                return it->second;
            return std::string();
        };
        bool ok = false;
        if (values.count("--exclude")) {
            bool v = parse_bool(ropt("--exclude"), ok);
            if (!ok)
                throw std::runtime_error("Invalid per-repo exclude for " + repo);
            ro.exclude = v;
        }
        if (values.count("--timeout")) {
            auto dur = parse_duration(ropt("--timeout"), ok);
            if (!ok || dur.count() < 1 || dur > MAX_DURATION_OPTION)
                throw std::runtime_error("Invalid per-repo timeout for " + repo);
            ro.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(dur);
        }
        opts.repo_settings[normalize_repo_path(repo)] = ro;
    }
}
