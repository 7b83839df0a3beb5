// =================================================================
// src/Repolens/GlobPattern.cpp
// =================================================================
// Implementation for shell-glob matching against file base names.

#include "Repolens/GlobPattern.hpp"
#include "Repolens/Logger.hpp"
#include <cctype>
#include <cwchar>
#include <fstream>
#include <utility>

namespace Repolens {

namespace {

// Strips surrounding whitespace, including the CR of CRLF line endings.
std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Decodes UTF-8 into one wide character per code point. Bytes that do not
// form a valid sequence decode to U+FFFD one at a time.
std::wstring decodeUtf8(const std::string& text) {
    std::wstring out;
    out.reserve(text.size());
    const size_t length = text.size();
    size_t i = 0;
    while (i < length) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        char32_t code = 0;
        if (lead < 0x80) {
            code = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code = lead & 0x07;
        } else {
            out += static_cast<wchar_t>(0xFFFD);
            ++i;
            continue;
        }

        bool valid = i + extra < length;
        for (size_t k = 1; valid && k <= extra; ++k) {
            unsigned char next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
            } else {
                code = (code << 6) | (next & 0x3F);
            }
        }
        static const char32_t min_code[] = {0, 0x80, 0x800, 0x10000};
        if (!valid || code < min_code[extra] || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
            out += static_cast<wchar_t>(0xFFFD);
            ++i;
            continue;
        }
        out += static_cast<wchar_t>(code);
        i += extra + 1;
    }
    return out;
}

void appendLiteral(std::wstring& out, wchar_t c) {
    if (c != L'\0' && std::wcschr(L".^$|()[]{}*+?\\/", c) != nullptr) {
        out += L'\\';
    }
    out += c;
}

} // namespace

GlobPattern::GlobPattern(const std::string& pattern)
    : m_pattern(pattern),
      m_valid(false)
{
    std::wstring regex_pattern;
    if (!globToRegex(decodeUtf8(pattern), regex_pattern)) {
        REPOLENS_LOG_WARNING("GlobPattern", "Malformed glob pattern ignored: '" + pattern + "'");
        return;
    }

    try {
        m_regex = std::wregex(regex_pattern, std::regex_constants::ECMAScript);
        m_valid = true;
    } catch (const std::regex_error& e) {
        REPOLENS_LOG_WARNING("GlobPattern",
            "Failed to compile glob pattern '" + pattern + "': " + e.what());
    }
}

bool GlobPattern::matches(const std::string& name) const {
    if (!m_valid) {
        return false;
    }
    return std::regex_match(decodeUtf8(name), m_regex);
}

bool GlobPattern::globToRegex(const std::wstring& glob_pattern, std::wstring& regex_pattern) {
    regex_pattern.clear();
    const size_t length = glob_pattern.length();

    for (size_t i = 0; i < length; ++i) {
        wchar_t c = glob_pattern[i];

        switch (c) {
            case L'*':
                regex_pattern += L"[^/]*";
                break;

            case L'?':
                regex_pattern += L"[^/]";
                break;

            case L'\\':
                if (i + 1 >= length) {
                    return false;
                }
                appendLiteral(regex_pattern, glob_pattern[++i]);
                break;

            case L'[': {
                size_t j = i + 1;
                regex_pattern += L'[';
                if (j < length && (glob_pattern[j] == L'!' || glob_pattern[j] == L'^')) {
                    regex_pattern += L'^';
                    ++j;
                }
                // A leading ']' is part of the class, not its end
                if (j < length && glob_pattern[j] == L']') {
                    regex_pattern += L"\\]";
                    ++j;
                }
                while (j < length && glob_pattern[j] != L']') {
                    wchar_t member = glob_pattern[j];
                    if (member == L'\\') {
                        if (j + 1 >= length) {
                            return false;
                        }
                        wchar_t escaped = glob_pattern[j + 1];
                        // "\d" in a regex class is a digit class, not 'd'
                        if (escaped < 0x80 && !std::isalnum(static_cast<unsigned char>(escaped))) {
                            regex_pattern += L'\\';
                        }
                        regex_pattern += escaped;
                        j += 2;
                        continue;
                    }
                    if (member == L'[') {
                        regex_pattern += L"\\[";
                    } else {
                        regex_pattern += member;
                    }
                    ++j;
                }
                if (j >= length) {
                    return false; // unterminated class
                }
                regex_pattern += L']';
                i = j;
                break;
            }

            default:
                appendLiteral(regex_pattern, c);
                break;
        }
    }

    return true;
}

// GlobPatternSet implementation

void GlobPatternSet::addPattern(const std::string& pattern) {
    if (pattern.empty()) {
        return;
    }
    m_patterns.emplace_back(pattern);
}

bool GlobPatternSet::readPatternFile(const std::string& file_path, std::vector<std::string>& patterns) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        REPOLENS_LOG_DEBUG("GlobPatternSet", "No ignore-file at " + file_path + ", continuing without patterns");
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::string pattern = trim(line);
        if (pattern.empty() || pattern[0] == '#') {
            continue;
        }
        patterns.push_back(std::move(pattern));
    }
    return true;
}

bool GlobPatternSet::matchesAny(const std::string& name) const {
    for (const auto& pattern : m_patterns) {
        if (pattern.matches(name)) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> GlobPatternSet::getPatterns() const {
    std::vector<std::string> patterns;
    patterns.reserve(m_patterns.size());
    for (const auto& pattern : m_patterns) {
        patterns.push_back(pattern.getPattern());
    }
    return patterns;
}

} // namespace Repolens
