#include <restorenom/path.hpp>
#include <cctype>
#include <vector>

namespace restorenom::path {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool is_drive_letter(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

// Length of the root prefix of p, 0 for relative paths
static size_t root_length(const std::string& p) {
    if (p.size() >= 2 && is_separator(p[0]) && is_separator(p[1])) {
        // UNC root: two separators, server, share
        size_t pos = 2;
        for (int part = 0; part < 2 && pos < p.size(); ++part) {
            while (pos < p.size() && !is_separator(p[pos])) ++pos;
            if (pos < p.size()) ++pos;
        }
        return pos;
    }
    if (p.size() >= 3 && is_drive_letter(p[0]) && p[1] == ':' && is_separator(p[2])) {
        return 3;
    }
    if (!p.empty() && is_separator(p[0])) {
        return 1;
    }
    return 0;
}

static std::vector<std::string> split_components(const std::string& p, size_t from) {
    std::vector<std::string> parts;
    std::string current;
    for (size_t i = from; i < p.size(); ++i) {
        if (is_separator(p[i])) {
            if (!current.empty()) parts.push_back(std::move(current));
            current.clear();
        } else {
            current += p[i];
        }
    }
    if (!current.empty()) parts.push_back(std::move(current));
    return parts;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool is_separator(char c) {
    return c == '/' || c == '\\';
}

bool is_rooted(const std::string& p) {
    return root_length(p) > 0;
}

char preferred_separator(const std::string& p) {
    for (char c : p) {
        if (is_separator(c)) return c;
    }
    return '/';
}

std::string trim_trailing_separators(const std::string& p) {
    size_t root = root_length(p);
    size_t end = p.size();
    while (end > root && is_separator(p[end - 1])) --end;
    return p.substr(0, end);
}

std::string normalize(const std::string& p) {
    if (p.empty()) return p;

    const char sep = preferred_separator(p);
    const size_t root_len = root_length(p);

    std::string root = p.substr(0, root_len);
    for (char& c : root) {
        if (is_separator(c)) c = sep;
    }

    std::vector<std::string> stack;
    for (auto& part : split_components(p, root_len)) {
        if (part == ".") continue;
        if (part == "..") {
            if (!stack.empty() && stack.back() != "..") {
                stack.pop_back();
            } else if (root_len == 0) {
                stack.push_back(std::move(part));
            }
            // rooted: ".." at the root stays at the root
            continue;
        }
        stack.push_back(std::move(part));
    }

    std::string out = root;
    for (size_t i = 0; i < stack.size(); ++i) {
        if (i > 0) out += sep;
        out += stack[i];
    }
    if (out.empty()) out = ".";
    return out;
}

std::string make_rooted(const std::string& base_dir, const std::string& p) {
    if (is_rooted(p) || base_dir.empty()) {
        return normalize(p);
    }
    std::string base = trim_trailing_separators(base_dir);
    std::string combined = base;
    if (!is_separator(combined.back())) {
        combined += preferred_separator(base);
    }
    combined += p;
    return normalize(combined);
}

std::string parent_directory(const std::string& p) {
    const size_t root_len = root_length(p);
    std::string trimmed = trim_trailing_separators(p);

    size_t pos = trimmed.size();
    while (pos > root_len && !is_separator(trimmed[pos - 1])) --pos;
    if (pos <= root_len) {
        return p.substr(0, root_len);
    }
    return trim_trailing_separators(trimmed.substr(0, pos));
}

} // namespace restorenom::path
