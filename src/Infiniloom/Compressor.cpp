// =================================================================
// src/Infiniloom/Compressor.cpp
// =================================================================
// Implementation for graduated, language-aware source text compression.

#include "Infiniloom/Compressor.hpp"
#include "Infiniloom/Types.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace Infiniloom {

namespace {

struct CommentSyntax {
    const char* line_prefix;    ///< nullptr when the language has none
    bool c_style;               ///< "/* */" blocks and "///" doc lines
    bool ruby_blocks;           ///< "=begin" ... "=end"
    bool backtick_strings;      ///< multi-line `...` literals
};

CommentSyntax commentSyntax(Language language) {
    switch (language) {
        case Language::PYTHON:
            return {"#", false, false, false};
        case Language::RUBY:
            return {"#", false, true, false};
        case Language::JAVASCRIPT:
        case Language::TYPESCRIPT:
        case Language::GO:
            return {"//", true, false, true};
        case Language::RUST:
        case Language::JAVA:
        case Language::C:
        case Language::CPP:
        case Language::CSHARP:
        case Language::PHP:
            return {"//", true, false, false};
        default:
            return {nullptr, false, false, false};
    }
}

bool startsWith(const std::string& value, const char* prefix) {
    return value.compare(0, std::strlen(prefix), prefix) == 0;
}

bool contains(const std::string& value, const char* needle) {
    return value.find(needle) != std::string::npos;
}

bool endsWith(const std::string& value, const char* suffix) {
    size_t length = std::strlen(suffix);
    return value.size() >= length && value.compare(value.size() - length, length, suffix) == 0;
}

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

// Collapse runs of spaces and tabs after the indentation into one space
std::string normalizeInterior(const std::string& line) {
    size_t indent = line.find_first_not_of(" \t");
    if (indent == std::string::npos) {
        return line;
    }

    std::string result = line.substr(0, indent);
    bool prev_space = false;
    for (size_t i = indent; i < line.size(); ++i) {
        char c = line[i];
        if (c == ' ' || c == '\t') {
            if (!prev_space) {
                result.push_back(' ');
                prev_space = true;
            }
            continue;
        }
        prev_space = false;
        result.push_back(c);
    }
    return result;
}

std::string toLower(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

/**
 * @brief Find the end of a Rust char literal opening at `open`
 * @return Offset one past the closing quote, or npos for a lifetime or label
 */
size_t rustCharLiteralEnd(const std::string& source, size_t open) {
    size_t k = open + 1;
    if (k >= source.size() || source[k] == '\n' || source[k] == '\'') {
        return std::string::npos;
    }

    if (source[k] == '\\') {
        k++;
        if (k >= source.size()) {
            return std::string::npos;
        }
        if (source[k] == 'u' && k + 1 < source.size() && source[k + 1] == '{') {
            size_t close = source.find('}', k + 2);
            if (close == std::string::npos || close - k > 8) {
                return std::string::npos;
            }
            k = close + 1;
        } else if (source[k] == 'x') {
            k += 3;
        } else {
            k++;
        }
    } else {
        unsigned char lead = static_cast<unsigned char>(source[k]);
        if (lead >= 0xF0) {
            k += 4;
        } else if (lead >= 0xE0) {
            k += 3;
        } else if (lead >= 0xC0) {
            k += 2;
        } else {
            k++;
        }
    }

    if (k < source.size() && source[k] == '\'') {
        return k + 1;
    }
    return std::string::npos;
}
} // namespace

CompressionConfig CompressionConfig::forLevel(CompressionLevel level) {
    CompressionConfig config;
    config.level = level;
    config.strip_line_comments = false;
    config.strip_block_comments = false;
    config.strip_docstrings = false;
    config.collapse_blank_lines = false;
    config.normalize_whitespace = false;
    config.trim_trailing_whitespace = false;

    switch (level) {
        case CompressionLevel::NONE:
            break;
        case CompressionLevel::EXTREME:
        case CompressionLevel::AGGRESSIVE:
            config.strip_docstrings = true;
            config.normalize_whitespace = true;
            // fall through
        case CompressionLevel::BALANCED:
            config.strip_line_comments = true;
            config.strip_block_comments = true;
            // fall through
        case CompressionLevel::MINIMAL:
            config.collapse_blank_lines = true;
            config.trim_trailing_whitespace = true;
            break;
    }
    return config;
}

std::string Compressor::compress(const std::string& source, Language language) const {
    switch (m_config.level) {
        case CompressionLevel::NONE:
            return source;
        case CompressionLevel::EXTREME:
            return extractSymbols(source, language);
        default:
            break;
    }

    bool strips = m_config.strip_line_comments || m_config.strip_block_comments || m_config.strip_docstrings;
    if (strips) {
        return rewriteLines(stripComments(source, language));
    }

    std::vector<Line> lines;
    size_t start = 0;
    while (true) {
        size_t end = source.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(Line{source.substr(start), false});
            break;
        }
        lines.push_back(Line{source.substr(start, end - start), false});
        start = end + 1;
    }
    return rewriteLines(lines);
}

std::string Compressor::compress(const std::string& source, CompressionLevel level, Language language) {
    return Compressor(CompressionConfig::forLevel(level)).compress(source, language);
}

std::vector<Compressor::Line> Compressor::stripComments(const std::string& source, Language language) const {
    const CommentSyntax syntax = commentSyntax(language);
    const size_t n = source.size();

    std::vector<Line> lines;
    Line current;
    bool at_line_start = true;

    auto endLine = [&]() {
        lines.push_back(std::move(current));
        current = Line();
        at_line_start = true;
    };

    // Keep source[from, to), splitting output lines on newlines
    auto keep = [&](size_t from, size_t to) {
        for (size_t k = from; k < to; ++k) {
            char c = source[k];
            if (c == '\n') {
                endLine();
                continue;
            }
            current.text.push_back(c);
            if (c != ' ' && c != '\t' && c != '\r') {
                at_line_start = false;
            }
        }
    };

    auto startsAt = [&](size_t pos, const char* token) {
        return source.compare(pos, std::strlen(token), token) == 0;
    };

    size_t i = 0;
    while (i < n) {
        char c = source[i];

        if (c == '\n') {
            endLine();
            i++;
            continue;
        }

        // Ruby =begin/=end blocks
        if (syntax.ruby_blocks && at_line_start && startsAt(i, "=begin")) {
            size_t close = source.find("\n=end", i);
            size_t stop = close == std::string::npos ? n : source.find('\n', close + 5);
            if (stop == std::string::npos) {
                stop = n;
            }
            if (m_config.strip_block_comments) {
                current.removed = true;
            } else {
                keep(i, stop);
            }
            i = stop;
            continue;
        }

        // Python triple-quoted strings; docstrings start their line
        if (language == Language::PYTHON && (startsAt(i, "\"\"\"") || startsAt(i, "'''"))) {
            size_t close = source.find(source.substr(i, 3), i + 3);
            size_t stop = close == std::string::npos ? n : close + 3;
            if (at_line_start && m_config.strip_docstrings) {
                current.removed = true;
            } else {
                keep(i, stop);
            }
            i = stop;
            continue;
        }

        if (syntax.line_prefix != nullptr && startsAt(i, syntax.line_prefix)) {
            size_t stop = source.find('\n', i);
            if (stop == std::string::npos) {
                stop = n;
            }
            bool doc = syntax.c_style && (startsAt(i, "///") || startsAt(i, "//!"));
            if (m_config.strip_line_comments || (doc && m_config.strip_docstrings)) {
                current.removed = true;
            } else {
                keep(i, stop);
            }
            i = stop;
            continue;
        }

        if (syntax.c_style && startsAt(i, "/*")) {
            size_t close = source.find("*/", i + 2);
            size_t stop = close == std::string::npos ? n : close + 2;
            bool doc = startsAt(i, "/**") && !startsAt(i, "/**/");
            if (m_config.strip_block_comments || (doc && m_config.strip_docstrings)) {
                current.removed = true;
            } else {
                keep(i, stop);
            }
            i = stop;
            continue;
        }

        // Rust lifetimes and loop labels share the quote with char literals
        if (c == '\'' && language == Language::RUST) {
            size_t stop = rustCharLiteralEnd(source, i);
            if (stop == std::string::npos) {
                current.text.push_back(c);
                at_line_start = false;
                i++;
            } else {
                keep(i, stop);
                i = stop;
            }
            continue;
        }

        if (c == '"' || c == '\'' || (c == '`' && syntax.backtick_strings)) {
            size_t k = i + 1;
            while (k < n) {
                if (source[k] == '\\' && k + 1 < n) {
                    k += 2;
                    continue;
                }
                if (source[k] == c) {
                    k++;
                    break;
                }
                // Only backtick literals span lines
                if (source[k] == '\n' && c != '`') {
                    break;
                }
                k++;
            }
            keep(i, k);
            i = k;
            continue;
        }

        current.text.push_back(c);
        if (c != ' ' && c != '\t' && c != '\r') {
            at_line_start = false;
        }
        i++;
    }

    lines.push_back(std::move(current));
    return lines;
}

std::string Compressor::rewriteLines(const std::vector<Line>& lines) const {
    std::vector<std::string> kept;
    kept.reserve(lines.size());
    uint32_t blank_run = 0;

    for (const auto& line : lines) {
        bool blank = isBlank(line.text);

        // Nothing but a removed comment
        if (blank && line.removed) {
            continue;
        }

        std::string text = line.text;
        if (m_config.trim_trailing_whitespace) {
            size_t last = text.find_last_not_of(" \t\r");
            text.erase(last == std::string::npos ? 0 : last + 1);
        }

        if (blank) {
            blank_run++;
            if (m_config.collapse_blank_lines && m_config.max_consecutive_blank_lines > 0 &&
                blank_run > m_config.max_consecutive_blank_lines) {
                continue;
            }
        } else {
            blank_run = 0;
            if (m_config.normalize_whitespace) {
                text = normalizeInterior(text);
            }
        }

        kept.push_back(std::move(text));
    }

    std::string result;
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) {
            result.push_back('\n');
        }
        result += kept[i];
    }
    return result;
}

std::string Compressor::extractSymbols(const std::string& source, Language language) const {
    std::string result;
    bool first = true;
    size_t start = 0;

    while (start <= source.size()) {
        size_t end = source.find('\n', start);
        if (end == std::string::npos) {
            end = source.size();
        }
        std::string line = source.substr(start, end - start);

        size_t first_char = line.find_first_not_of(" \t\r");
        if (first_char != std::string::npos) {
            size_t last_char = line.find_last_not_of(" \t\r");
            std::string trimmed = line.substr(first_char, last_char - first_char + 1);

            bool keep = (m_config.preserve_imports && isImportStatement(trimmed, language)) ||
                        (m_config.preserve_signatures && isDefinitionStart(trimmed, language));
            if (keep) {
                if (!first) {
                    result.push_back('\n');
                }
                result += line;
                first = false;
            }
        }

        start = end + 1;
    }

    return result;
}

bool Compressor::isImportStatement(const std::string& line, Language language) {
    switch (language) {
        case Language::PYTHON:
            return startsWith(line, "import ") || startsWith(line, "from ");
        case Language::JAVASCRIPT:
        case Language::TYPESCRIPT:
            return startsWith(line, "import ") || startsWith(line, "export ") || startsWith(line, "require(");
        case Language::RUST:
            return startsWith(line, "use ") || startsWith(line, "mod ");
        case Language::GO:
        case Language::JAVA:
            return startsWith(line, "import ") || startsWith(line, "package ");
        case Language::C:
        case Language::CPP:
            return startsWith(line, "#include");
        case Language::CSHARP:
            return startsWith(line, "using ");
        case Language::RUBY:
            return startsWith(line, "require ") || startsWith(line, "require_relative ");
        case Language::PHP:
            return startsWith(line, "use ") || startsWith(line, "require ") || startsWith(line, "include ");
        default:
            return false;
    }
}

bool Compressor::isDefinitionStart(const std::string& line, Language language) {
    switch (language) {
        case Language::PYTHON:
            return startsWith(line, "def ") || startsWith(line, "class ") || startsWith(line, "async def ");
        case Language::JAVASCRIPT:
        case Language::TYPESCRIPT:
            return startsWith(line, "function ") || startsWith(line, "class ") ||
                   startsWith(line, "const ") || startsWith(line, "let ") ||
                   startsWith(line, "var ") || contains(line, "=>");
        case Language::RUST:
            return startsWith(line, "fn ") || startsWith(line, "pub fn ") ||
                   startsWith(line, "struct ") || startsWith(line, "enum ") ||
                   startsWith(line, "impl ") || startsWith(line, "trait ");
        case Language::GO:
            return startsWith(line, "func ") || startsWith(line, "type ");
        case Language::JAVA:
            return contains(line, "class ") || contains(line, "interface ") || contains(line, "enum ") ||
                   (contains(line, "(") && contains(line, ")") && contains(line, "{"));
        case Language::C:
        case Language::CPP:
            return contains(line, "(") && contains(line, ")") && (contains(line, "{") || endsWith(line, ")"));
        case Language::CSHARP:
            return contains(line, "class ") || contains(line, "interface ") || contains(line, "struct ");
        case Language::RUBY:
            return startsWith(line, "def ") || startsWith(line, "class ") || startsWith(line, "module ");
        case Language::PHP:
            return startsWith(line, "function ") || startsWith(line, "class ") || contains(line, "public function");
        default:
            return false;
    }
}

std::string Compressor::levelName(CompressionLevel level) {
    switch (level) {
        case CompressionLevel::NONE: return "none";
        case CompressionLevel::MINIMAL: return "minimal";
        case CompressionLevel::BALANCED: return "balanced";
        case CompressionLevel::AGGRESSIVE: return "aggressive";
        case CompressionLevel::EXTREME: return "extreme";
    }
    return "balanced";
}

bool Compressor::parseLevel(const std::string& name, CompressionLevel& level) {
    const std::string lower = toLower(name);
    for (CompressionLevel candidate : {CompressionLevel::NONE, CompressionLevel::MINIMAL,
                                       CompressionLevel::BALANCED, CompressionLevel::AGGRESSIVE,
                                       CompressionLevel::EXTREME}) {
        if (lower == levelName(candidate)) {
            level = candidate;
            return true;
        }
    }
    return false;
}

std::string Compressor::description(CompressionLevel level) {
    switch (level) {
        case CompressionLevel::NONE: return "No compression";
        case CompressionLevel::MINIMAL: return "Remove empty lines, trim whitespace";
        case CompressionLevel::BALANCED: return "Remove comments, normalize whitespace";
        case CompressionLevel::AGGRESSIVE: return "Signatures only, remove docstrings";
        case CompressionLevel::EXTREME: return "Key symbols only";
    }
    return "";
}

int Compressor::expectedReduction(CompressionLevel level) {
    switch (level) {
        case CompressionLevel::NONE: return 0;
        case CompressionLevel::MINIMAL: return 15;
        case CompressionLevel::BALANCED: return 35;
        case CompressionLevel::AGGRESSIVE: return 60;
        case CompressionLevel::EXTREME: return 80;
    }
    return 0;
}

std::string Compressor::languageName(Language language) {
    switch (language) {
        case Language::PYTHON: return "python";
        case Language::JAVASCRIPT: return "javascript";
        case Language::TYPESCRIPT: return "typescript";
        case Language::RUST: return "rust";
        case Language::GO: return "go";
        case Language::JAVA: return "java";
        case Language::C: return "c";
        case Language::CPP: return "cpp";
        case Language::CSHARP: return "csharp";
        case Language::RUBY: return "ruby";
        case Language::PHP: return "php";
        default: return "unknown";
    }
}

Language Compressor::languageFromTag(const std::string& tag) {
    const std::string lower = toLower(tag);
    if (lower == "jsx" || lower == "js") {
        return Language::JAVASCRIPT;
    }
    if (lower == "tsx" || lower == "ts") {
        return Language::TYPESCRIPT;
    }
    if (lower == "c++") {
        return Language::CPP;
    }
    if (lower == "c#") {
        return Language::CSHARP;
    }

    for (int code = 0; code < static_cast<int>(Language::UNKNOWN); ++code) {
        Language language = static_cast<Language>(code);
        if (lower == languageName(language)) {
            return language;
        }
    }
    return Language::UNKNOWN;
}

Language Compressor::languageFromFilename(const std::string& filename) {
    return languageFromTag(detectLanguage(filename));
}

} // namespace Infiniloom
