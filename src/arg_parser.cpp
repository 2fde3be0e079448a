#include "arg_parser.hpp"

namespace {

bool looks_like_flag(const std::string& s) { return s.size() > 1 && s[0] == '-'; }

} // namespace

ArgParser::ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags,
                     const std::map<char, std::string>& short_map,
                     const std::set<std::string>& switches)
    : known_flags_(known_flags), short_map_(short_map), switches_(switches) {
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i] ? argv[i] : "";
        if (options_done || !looks_like_flag(arg)) {
            positional_.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }
        if (arg.rfind("--", 0) == 0) {
            size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                std::string key = arg.substr(0, eq);
                if (accept(key))
                    store(key, arg.substr(eq + 1));
            } else if (!switches_.count(arg) && i + 1 < argc && argv[i + 1] &&
                       !looks_like_flag(argv[i + 1])) {
                std::string val = argv[++i];
                if (accept(arg))
                    store(arg, val);
            } else {
                accept(arg);
            }
            continue;
        }
        // Short options: "-n4", "-n 4", "-n=4" or bundled switches like "-er".
        for (size_t j = 1; j < arg.size(); ++j) {
            auto it = short_map_.find(arg[j]);
            if (it == short_map_.end()) {
                unknown_flags_.push_back(std::string("-") + arg[j]);
                break;
            }
            const std::string& key = it->second;
            if (switches_.count(key)) {
                accept(key);
                continue;
            }
            std::string val;
            if (j + 1 < arg.size()) {
                val = arg.substr(j + 1);
                if (!val.empty() && val[0] == '=')
                    val.erase(0, 1);
            } else if (i + 1 < argc && argv[i + 1] && !looks_like_flag(argv[i + 1])) {
                val = argv[++i];
            }
            if (accept(key) && !val.empty())
                store(key, val);
            break;
        }
    }
}

bool ArgParser::accept(const std::string& key) {
    if (!known_flags_.empty() && !known_flags_.count(key)) {
        unknown_flags_.push_back(key);
        return false;
    }
    flags_.insert(key);
    return true;
}

void ArgParser::store(const std::string& key, const std::string& val) {
    options_[key] = val;
    multi_options_[key].push_back(val);
}

std::string ArgParser::get_option(const std::string& opt) const {
    auto it = options_.find(opt);
    if (it != options_.end())
        return it->second;
    return "";
}

std::vector<std::string> ArgParser::get_all_options(const std::string& opt) const {
    auto it = multi_options_.find(opt);
    if (it != multi_options_.end())
        return it->second;
    return {};
}
