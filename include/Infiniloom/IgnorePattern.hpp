// =================================================================
// include/Infiniloom/IgnorePattern.hpp
// =================================================================
// Header for gitignore-compatible pattern matching functionality.

#pragma once

#include <string>
#include <vector>

namespace Infiniloom {

/**
 * @brief A single gitignore-style rule
 *
 * Supports the gitignore syntax used at repository roots:
 * - Wildcards: * and ? (never crossing '/'), ** (any depth)
 * - Negation: !pattern
 * - Directory-only patterns: pattern/
 * - Rooted patterns: /pattern, or any pattern with an inner '/'
 * - Comment lines: # comment
 */
class IgnorePattern {
public:
    /**
     * @brief Parse one line of an ignore file
     * @param line Raw line, surrounding whitespace is trimmed
     */
    explicit IgnorePattern(const std::string& line);

    /**
     * @brief Check if a path matches this pattern
     * @param path Relative path from the scan root, '/'-separated
     * @param is_directory True if the path is a directory
     * @return true if the pattern applies to the path
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    bool isNegation() const { return m_is_negation; }
    bool isDirectoryOnly() const { return m_directory_only; }
    bool isRooted() const { return m_is_rooted; }
    bool hasDoubleStar() const { return m_has_double_star; }

    /**
     * @brief Get the pattern body without the !, / modifiers
     */
    const std::string& getPattern() const { return m_pattern; }

    /**
     * @brief Check if the line was blank or a comment
     * @return true if the pattern never matches anything
     */
    bool isEmpty() const { return m_is_empty; }

    /**
     * @brief Match a glob against a whole string
     *
     * '?' matches one character and '*' any run of characters, neither
     * of them crossing a '/'. '**' matches across separators.
     *
     * @param pattern Glob pattern
     * @param text Text to match
     * @return true if the whole text matches
     */
    static bool globMatch(const std::string& pattern, const std::string& text);

private:
    std::string m_pattern;
    bool m_is_negation = false;
    bool m_directory_only = false;
    bool m_is_rooted = false;
    bool m_has_double_star = false;
    bool m_is_empty = false;

    bool matchDoubleStar(const std::string& path) const;
};

/**
 * @brief Ordered rule list where the last matching rule decides
 */
class IgnoreMatcher {
public:
    /**
     * @brief Append every rule of an ignore file's text
     * @param text File content, one rule per line
     * @return Number of rules added
     */
    size_t parse(const std::string& text);

    /**
     * @brief Append the built-in rules (VCS folders, dependency and
     *        build output folders, editor and OS artifacts, logs)
     */
    void addDefaults();

    /**
     * @brief Add a single rule
     * @param line Rule text
     * @return false if the line was blank or a comment
     */
    bool addPattern(const std::string& line);

    /**
     * @brief Load rules from an ignore file
     * @param file_path Path to the ignore file
     * @return Number of rules loaded, 0 if the file cannot be read
     */
    size_t loadFromFile(const std::string& file_path);

    /**
     * @brief Check if a path should be ignored
     * @param path Relative path from the scan root
     * @param is_directory True if path is a directory
     * @return Verdict of the last rule matching the path, false if none does
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    size_t size() const { return m_patterns.size(); }

    void clear() { m_patterns.clear(); }

    const std::vector<IgnorePattern>& patterns() const { return m_patterns; }

private:
    std::vector<IgnorePattern> m_patterns;
};

} // namespace Infiniloom
