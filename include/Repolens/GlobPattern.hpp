// =================================================================
// include/Repolens/GlobPattern.hpp
// =================================================================
// Header for shell-glob matching against file base names.

#pragma once

#include <string>
#include <vector>
#include <regex>

namespace Repolens {

/**
 * @brief Shell-glob pattern matched against a single file name
 *
 * Patterns and names are UTF-8 and are matched per code point, so `?`
 * consumes a whole multi-byte character.
 *
 * Supported syntax:
 * - `*` matches any run of characters except `/`
 * - `?` matches exactly one character except `/`
 * - `[abc]`, `[a-z]`, `[!a-z]`, `[^a-z]` character classes
 * - `\x` matches the character `x` literally
 *
 * There is no `**`, no negation and no anchoring. A malformed pattern
 * (unterminated class, trailing backslash) never matches anything.
 */
class GlobPattern {
public:
    /**
     * @brief Compile a glob pattern
     * @param pattern The pattern text, taken literally
     */
    explicit GlobPattern(const std::string& pattern);

    /**
     * @brief Check whether a base name matches the whole pattern
     * @param name File base name (no directory components)
     * @return true if the pattern matches
     */
    bool matches(const std::string& name) const;

    /**
     * @brief Get the pattern as provided to the constructor
     */
    const std::string& getPattern() const { return m_pattern; }

    /**
     * @brief Check whether the pattern compiled successfully
     */
    bool isValid() const { return m_valid; }

private:
    std::string m_pattern;
    bool m_valid;
    std::wregex m_regex;

    /**
     * @brief Translate a glob into an ECMAScript regex body
     * @param glob_pattern Glob pattern, one element per code point
     * @param regex_pattern Receives the regex on success
     * @return false if the glob is malformed
     */
    static bool globToRegex(const std::wstring& glob_pattern, std::wstring& regex_pattern);
};

/**
 * @brief Ordered collection of glob patterns; any match excludes a name
 */
class GlobPatternSet {
public:
    /**
     * @brief Add a pattern to the set
     * @param pattern Pattern text; empty strings are ignored
     */
    void addPattern(const std::string& pattern);

    /**
     * @brief Read pattern lines from an ignore-file without compiling them
     *
     * Lines are trimmed; blank lines and lines starting with `#` are
     * skipped.
     *
     * @param file_path Path to the ignore-file
     * @param patterns Receives the patterns, appended in file order
     * @return false if the file could not be opened
     */
    static bool readPatternFile(const std::string& file_path, std::vector<std::string>& patterns);

    /**
     * @brief Check a base name against every pattern
     * @param name File base name
     * @return true if at least one pattern matches
     */
    bool matchesAny(const std::string& name) const;

    /**
     * @brief Get the pattern strings in insertion order
     */
    std::vector<std::string> getPatterns() const;

    size_t size() const { return m_patterns.size(); }
    bool empty() const { return m_patterns.empty(); }

private:
    std::vector<GlobPattern> m_patterns;
};

} // namespace Repolens
