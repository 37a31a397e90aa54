#include "dependency_field.hpp"
#include "utils.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace {

std::vector<std::string_view> split(std::string_view s, char delim) {
    std::vector<std::string_view> res;
    size_t start = 0, end = 0;
    while ((end = s.find(delim, start)) != std::string_view::npos) {
        res.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    res.push_back(s.substr(start));
    return res;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Folds every run of whitespace into one space.
std::string collapse_whitespace(std::string_view s) {
    std::string res;
    res.reserve(s.size());
    bool in_space = false;
    for (char c : s) {
        if (is_space(c)) {
            if (!in_space) res += ' ';
            in_space = true;
        } else {
            res += c;
            in_space = false;
        }
    }
    return res;
}

// Drops each "(...)" span up to the first closing parenthesis. An unclosed
// '(' and everything after it are kept.
std::string strip_constraints(std::string_view s) {
    std::string res;
    res.reserve(s.size());
    size_t start = 0;
    while (start < s.size()) {
        const size_t open = s.find('(', start);
        if (open == std::string_view::npos) break;
        const size_t close = s.find(')', open + 1);
        if (close == std::string_view::npos) break;
        res.append(s.substr(start, open - start));
        start = close + 1;
    }
    if (start < s.size()) res.append(s.substr(start));
    return res;
}

void add_unique(std::vector<std::string>& out, std::string name) {
    if (name.empty()) return;
    if (std::find(out.begin(), out.end(), name) == out.end()) {
        out.push_back(std::move(name));
    }
}

} // anonymous namespace

std::vector<std::string> parse_dependency_field(std::string_view raw) {
    std::vector<std::string> out;
    const std::string line = trim(collapse_whitespace(raw));
    if (line.empty()) return out;

    for (auto term : split(line, ',')) {
        std::string part = trim(term);
        if (part.empty()) continue;

        part = trim(strip_constraints(part));

        if (part.find('|') != std::string::npos) {
            for (auto alt : split(part, '|')) {
                add_unique(out, trim(alt));
            }
        } else {
            add_unique(out, std::move(part));
        }
    }
    return out;
}
