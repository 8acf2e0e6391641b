// =================================================================
// src/Infiniloom/IgnorePattern.cpp
// =================================================================
// Implementation for gitignore-compatible pattern matching.

#include "Infiniloom/IgnorePattern.hpp"
#include "Infiniloom/Logger.hpp"
#include <fstream>
#include <sstream>

namespace Infiniloom {

namespace {

std::string getBasename(const std::string& path) {
    size_t pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Try the glob against the text and against every suffix that starts
// right after a '/'.
bool matchAtAnyDepth(const std::string& glob, const std::string& text) {
    if (IgnorePattern::globMatch(glob, text)) {
        return true;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '/' && IgnorePattern::globMatch(glob, text.substr(i + 1))) {
            return true;
        }
    }
    return false;
}

} // namespace

IgnorePattern::IgnorePattern(const std::string& line) {
    std::string working = line;

    // Trim whitespace
    size_t first = working.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        m_is_empty = true;
        return;
    }
    working = working.substr(first, working.find_last_not_of(" \t\r") - first + 1);

    // Skip comments
    if (working[0] == '#') {
        m_is_empty = true;
        return;
    }

    // Handle negation patterns
    if (working[0] == '!') {
        m_is_negation = true;
        working.erase(0, 1);
    }

    // Handle directory-only patterns
    if (!working.empty() && working.back() == '/') {
        m_directory_only = true;
        working.pop_back();
    }

    // Handle rooted patterns, explicit or implied by an inner separator
    if (!working.empty() && working[0] == '/') {
        m_is_rooted = true;
        working.erase(0, 1);
    } else if (working.find('/') != std::string::npos) {
        m_is_rooted = true;
    }

    if (working.empty()) {
        m_is_empty = true;
        return;
    }

    m_has_double_star = working.find("**") != std::string::npos;
    m_pattern = working;
}

bool IgnorePattern::matches(const std::string& path, bool is_directory) const {
    if (m_is_empty) {
        return false;
    }

    // Directory-only patterns only match directories
    if (m_directory_only && !is_directory) {
        return false;
    }

    if (m_has_double_star) {
        return matchDoubleStar(path);
    }

    if (m_is_rooted) {
        return globMatch(m_pattern, path);
    }

    // Unrooted patterns match the whole path or its last component
    return globMatch(m_pattern, path) || globMatch(m_pattern, getBasename(path));
}

bool IgnorePattern::matchDoubleStar(const std::string& path) const {
    // **/rest: rest at any depth
    if (startsWith(m_pattern, "**/")) {
        return matchAtAnyDepth(m_pattern.substr(3), path);
    }

    // prefix/**: everything below a directory matching prefix
    if (endsWith(m_pattern, "/**")) {
        std::string prefix = m_pattern.substr(0, m_pattern.size() - 3);
        for (size_t i = 0; i < path.size(); ++i) {
            if (path[i] == '/' && globMatch(prefix, path.substr(0, i))) {
                return true;
            }
        }
        return false;
    }

    // prefix/**/suffix: suffix at any depth below prefix
    size_t middle = m_pattern.find("/**/");
    if (middle != std::string::npos) {
        std::string prefix = m_pattern.substr(0, middle);
        std::string suffix = m_pattern.substr(middle + 4);
        for (size_t i = 0; i < path.size(); ++i) {
            if (path[i] == '/' && globMatch(prefix, path.substr(0, i)) &&
                matchAtAnyDepth(suffix, path.substr(i + 1))) {
                return true;
            }
        }
        return false;
    }

    if (globMatch(m_pattern, path)) {
        return true;
    }
    return !m_is_rooted && globMatch(m_pattern, getBasename(path));
}

bool IgnorePattern::globMatch(const std::string& pattern, const std::string& text) {
    size_t p = 0;
    size_t t = 0;
    size_t star_p = std::string::npos;
    size_t star_t = 0;
    bool star_crosses = false;

    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star_crosses = p + 1 < pattern.size() && pattern[p + 1] == '*';
            p += star_crosses ? 2 : 1;
            star_p = p;
            star_t = t;
        } else if (p < pattern.size() &&
                   ((pattern[p] == '?' && text[t] != '/') || pattern[p] == text[t])) {
            p++;
            t++;
        } else if (star_p != std::string::npos && (star_crosses || text[star_t] != '/')) {
            // Let the last star absorb one more character
            star_t++;
            t = star_t;
            p = star_p;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        p++;
    }

    return p == pattern.size();
}

// IgnoreMatcher implementation

size_t IgnoreMatcher::parse(const std::string& text) {
    std::istringstream stream(text);
    size_t added = 0;
    std::string line;
    while (std::getline(stream, line)) {
        if (addPattern(line)) {
            added++;
        }
    }
    return added;
}

void IgnoreMatcher::addDefaults() {
    static const char* const default_patterns[] = {
        // Version control
        ".git", ".svn", ".hg",

        // Dependencies
        "node_modules", "vendor", "__pycache__", ".venv", "venv", "env", ".env",
        "target", "zig-out", "zig-cache",

        // Build outputs
        "dist", "build", "out", ".next", ".nuxt",

        // Editors
        ".idea", ".vscode", "*.swp", "*.swo", "*~",

        // OS files
        ".DS_Store", "Thumbs.db",

        // Logs and coverage
        "*.log", "logs", "coverage", ".coverage", "htmlcov", ".nyc_output"
    };

    size_t added = 0;
    for (const char* pattern : default_patterns) {
        if (addPattern(pattern)) {
            added++;
        }
    }
    Logger::getInstance().logIgnoreRules("defaults", added);
}

bool IgnoreMatcher::addPattern(const std::string& line) {
    IgnorePattern pattern(line);
    if (pattern.isEmpty()) {
        return false;
    }
    m_patterns.push_back(std::move(pattern));
    return true;
}

size_t IgnoreMatcher::loadFromFile(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return 0;
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        INFINILOOM_LOG_WARNING("IgnoreMatcher", "Cannot read ignore file " + file_path);
        return 0;
    }

    size_t patterns_loaded = parse(content.str());
    Logger::getInstance().logIgnoreRules(file_path, patterns_loaded);
    return patterns_loaded;
}

bool IgnoreMatcher::matches(const std::string& path, bool is_directory) const {
    bool should_ignore = false;

    // Process patterns in order - later patterns override earlier ones
    for (const auto& pattern : m_patterns) {
        if (pattern.matches(path, is_directory)) {
            should_ignore = !pattern.isNegation();
        }
    }

    return should_ignore;
}

} // namespace Infiniloom
