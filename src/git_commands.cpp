#include "git_commands.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace git {

namespace {

bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string strip_upstream(const std::string& s) { return s.substr(0, s.find("...")); }

// "[ahead 1, behind 2]" or "[gone]" without the brackets.
bool valid_tracking_info(const std::string& info, bool& gone) {
    std::stringstream ss(info);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim_copy(item);
        if (item == "gone") {
            gone = true;
            continue;
        }
        auto sp = item.find(' ');
        if (sp == std::string::npos)
            return false;
        std::string word = item.substr(0, sp);
        if ((word != "ahead" && word != "behind") || !all_digits(item.substr(sp + 1)))
            return false;
    }
    return true;
}

bool parse_branch_header(const std::string& line, PorcelainStatus& st, std::string& error) {
    std::string rest = line.substr(3);
    if (rest == "HEAD (no branch)") {
        st.branch = DETACHED_HEAD;
        return true;
    }
    for (const char* prefix : {"No commits yet on ", "Initial commit on "}) {
        if (starts_with(rest, prefix)) {
            st.unborn = true;
            std::string name = strip_upstream(rest.substr(std::string(prefix).size()));
            if (name.empty())
                break;
            st.branch = name;
            return true;
        }
    }
    if (st.unborn) {
        error = "empty branch in header: " + line;
        return false;
    }
    std::string refs = rest;
    auto br = rest.find(" [");
    if (br != std::string::npos) {
        if (rest.back() != ']') {
            error = "unterminated tracking info: " + line;
            return false;
        }
        refs = rest.substr(0, br);
        std::string info = rest.substr(br + 2, rest.size() - br - 3);
        if (!valid_tracking_info(info, st.upstream_gone)) {
            error = "unexpected tracking info: " + line;
            return false;
        }
    }
    auto dots = refs.find("...");
    std::string name = dots == std::string::npos ? refs : refs.substr(0, dots);
    if (name.empty() || name.find(' ') != std::string::npos) {
        error = "unexpected branch header: " + line;
        return false;
    }
    st.branch = name;
    if (dots != std::string::npos) {
        std::string up = refs.substr(dots + 3);
        if (up.empty()) {
            error = "empty upstream in header: " + line;
            return false;
        }
        st.upstream = up;
    }
    return true;
}

} // namespace

std::string trim_copy(const std::string& s) {
    auto b = std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); });
    auto e = std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !std::isspace(c); })
                 .base();
    return b < e ? std::string(b, e) : std::string();
}

std::vector<std::string> status_args() { return {"status", "--porcelain=v1", "--branch"}; }

std::vector<std::string> ahead_behind_args() {
    return {"rev-list", "--left-right", "--count", "HEAD...@{upstream}"};
}

std::vector<std::vector<std::string>> operation_commands(OperationKind kind,
                                                         const std::string& argument) {
    switch (kind) {
    case OperationKind::Refresh:
        return {};
    case OperationKind::Fetch:
        return {{"fetch", "--all", "--prune"}};
    case OperationKind::Pull:
        return {{"pull", "--ff-only"}};
    case OperationKind::Push:
        return {{"push"}};
    case OperationKind::Sync:
        return {{"fetch", "--all", "--prune"}, {"pull", "--ff-only"}, {"push"}};
    case OperationKind::Prune:
        return {{"remote", "prune", "origin"}};
    case OperationKind::Checkout:
        return {{"checkout", argument}};
    }
    return {};
}

bool is_valid_branch_name(const std::string& name) {
    if (name.empty() || name[0] == '-')
        return false;
    if (name.find("..") != std::string::npos)
        return false;
    return std::none_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isspace(c) || std::iscntrl(c) || c == '~' || c == '^' || c == ':';
    });
}

bool is_network_operation(OperationKind kind) {
    switch (kind) {
    case OperationKind::Fetch:
    case OperationKind::Pull:
    case OperationKind::Push:
    case OperationKind::Sync:
    case OperationKind::Prune:
        return true;
    case OperationKind::Refresh:
    case OperationKind::Checkout:
        return false;
    }
    return false;
}

bool parse_porcelain_status(const std::string& out, PorcelainStatus& st, std::string& error) {
    st = PorcelainStatus{};
    std::istringstream in(out);
    std::string line;
    bool have_header = false;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;
        if (!have_header) {
            if (!starts_with(line, "## ")) {
                error = "missing branch header: " + line;
                return false;
            }
            if (!parse_branch_header(line, st, error))
                return false;
            have_header = true;
            continue;
        }
        if (line.size() < 4 || line[2] != ' ') {
            error = "malformed status entry: " + line;
            return false;
        }
        static const std::string codes = " MTADRCU?!";
        char x = line[0];
        char y = line[1];
        if (codes.find(x) == std::string::npos || codes.find(y) == std::string::npos) {
            error = "unknown status code: " + line;
            return false;
        }
        if (x == '?' && y == '?') {
            ++st.untracked;
            continue;
        }
        if (x == '!' && y == '!')
            continue;
        if (x != ' ')
            ++st.staged;
        if (y != ' ')
            st.dirty = true;
    }
    if (!have_header) {
        error = "empty status output";
        return false;
    }
    return true;
}

bool parse_ahead_behind(const std::string& out, unsigned& ahead, unsigned& behind,
                        std::string& error) {
    std::istringstream in(out);
    std::string a;
    std::string b;
    std::string extra;
    if (!(in >> a >> b) || (in >> extra) || !all_digits(a) || !all_digits(b)) {
        error = "unexpected rev-list output: " + trim_copy(out);
        return false;
    }
    try {
        ahead = static_cast<unsigned>(std::stoul(a));
        behind = static_cast<unsigned>(std::stoul(b));
    } catch (const std::exception&) {
        error = "rev-list count out of range: " + trim_copy(out);
        return false;
    }
    return true;
}

} // namespace git
