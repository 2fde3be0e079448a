#include "config_utils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace {

const char* const REPOSITORIES_KEY = "repositories";

bool to_string_value(const YAML::Node& node, std::string& out) {
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    if (!node.IsScalar())
        return false;
    out = node.Scalar();
    return true;
}

bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

bool bad_value(const std::string& key, std::string& error) {
    error = "Unsupported value for '" + key + "'";
    return false;
}

bool read_yaml_repositories(const YAML::Node& node, ConfigData& cfg, std::string& error) {
    auto& listed = cfg.lists["--repo"];
    if (node.IsSequence()) {
        for (const auto& item : node) {
            std::string s;
            if (!to_string_value(item, s) || s.empty())
                return bad_value(REPOSITORIES_KEY, error);
            listed.push_back(s);
        }
        return true;
    }
    if (!node.IsMap())
        return bad_value(REPOSITORIES_KEY, error);
    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string repo = it->first.Scalar();
        listed.push_back(repo);
        auto& m = cfg.repo_opts[repo];
        if (it->second.IsNull())
            continue;
        if (!it->second.IsMap())
            return bad_value(repo, error);
        for (auto sub = it->second.begin(); sub != it->second.end(); ++sub) {
            std::string s;
            if (!to_string_value(sub->second, s))
                return bad_value(sub->first.Scalar(), error);
            m["--" + sub->first.Scalar()] = s;
        }
    }
    return true;
}

bool read_json_repositories(const nlohmann::json& node, ConfigData& cfg, std::string& error) {
    auto& listed = cfg.lists["--repo"];
    if (node.is_array()) {
        for (const auto& item : node) {
            std::string s;
            if (!to_string_value(item, s) || s.empty())
                return bad_value(REPOSITORIES_KEY, error);
            listed.push_back(s);
        }
        return true;
    }
    if (!node.is_object())
        return bad_value(REPOSITORIES_KEY, error);
    for (auto it = node.begin(); it != node.end(); ++it) {
        listed.push_back(it.key());
        auto& m = cfg.repo_opts[it.key()];
        if (it.value().is_null())
            continue;
        if (!it.value().is_object())
            return bad_value(it.key(), error);
        for (auto sub = it.value().begin(); sub != it.value().end(); ++sub) {
            std::string s;
            if (!to_string_value(sub.value(), s))
                return bad_value(sub.key(), error);
            m["--" + sub.key()] = s;
        }
    }
    return true;
}

void assign_theme_field(const std::string& key, const std::string& val, TuiTheme& theme) {
    if (key == "reset")
        theme.reset = val;
    else if (key == "green")
        theme.green = val;
    else if (key == "yellow")
        theme.yellow = val;
    else if (key == "red")
        theme.red = val;
    else if (key == "cyan")
        theme.cyan = val;
    else if (key == "gray")
        theme.gray = val;
    else if (key == "bold")
        theme.bold = val;
    else if (key == "magenta")
        theme.magenta = val;
    else if (key == "inverse")
        theme.inverse = val;
}

} // namespace

bool load_yaml_config(const std::string& path, ConfigData& cfg, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const std::string key_name = it->first.Scalar();
            const YAML::Node& node = it->second;
            if (key_name == REPOSITORIES_KEY) {
                if (!read_yaml_repositories(node, cfg, error))
                    return false;
            } else if (node.IsSequence()) {
                auto& list = cfg.lists["--" + key_name];
                for (const auto& item : node) {
                    std::string s;
                    if (!to_string_value(item, s))
                        return bad_value(key_name, error);
                    list.push_back(s);
                }
            } else {
                std::string s;
                if (!to_string_value(node, s))
                    return bad_value(key_name, error);
                cfg.opts["--" + key_name] = s;
            }
        }
        return true;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, ConfigData& cfg, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto& val = it.value();
            const std::string key_name = it.key();
            if (key_name == REPOSITORIES_KEY) {
                if (!read_json_repositories(val, cfg, error))
                    return false;
            } else if (val.is_array()) {
                auto& list = cfg.lists["--" + key_name];
                for (const auto& item : val) {
                    std::string s;
                    if (!to_string_value(item, s))
                        return bad_value(key_name, error);
                    list.push_back(s);
                }
            } else {
                std::string s;
                if (!to_string_value(val, s))
                    return bad_value(key_name, error);
                cfg.opts["--" + key_name] = s;
            }
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_theme(const std::string& path, TuiTheme& theme, std::string& error) {
    std::string ext;
    auto pos = path.find_last_of('.');
    if (pos != std::string::npos)
        ext = path.substr(pos + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    if (ext == "json") {
        try {
            nlohmann::json root;
            ifs >> root;
            if (!root.is_object()) {
                error = "Root JSON value is not an object";
                return false;
            }
            for (auto it = root.begin(); it != root.end(); ++it) {
                if (it.value().is_string())
                    assign_theme_field(it.key(), it.value().get<std::string>(), theme);
            }
            return true;
        } catch (const nlohmann::json::exception& e) {
            error = e.what();
            return false;
        }
    }
    try {
        YAML::Node root = YAML::Load(ifs);
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (it->first.IsScalar() && it->second.IsScalar())
                assign_theme_field(it->first.Scalar(), it->second.Scalar(), theme);
        }
        return true;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}
