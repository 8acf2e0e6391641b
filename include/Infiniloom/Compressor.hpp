// =================================================================
// include/Infiniloom/Compressor.hpp
// =================================================================
// Header for graduated, language-aware source text compression.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Infiniloom {

/**
 * @brief Compression presets, from lossless to symbols only
 */
enum class CompressionLevel {
    NONE,           ///< Identity
    MINIMAL,        ///< Trim trailing whitespace, collapse blank lines
    BALANCED,       ///< Also strip comments
    AGGRESSIVE,     ///< Also strip docstrings, normalize whitespace
    EXTREME         ///< Import and definition lines only
};

/**
 * @brief Languages with comment and definition rules
 */
enum class Language {
    PYTHON,
    JAVASCRIPT,
    TYPESCRIPT,
    RUST,
    GO,
    JAVA,
    C,
    CPP,
    CSHARP,
    RUBY,
    PHP,
    UNKNOWN
};

/**
 * @brief Compression settings
 *
 * The level selects the mode (identity, line rewriting, or extreme line
 * selection); in line rewriting mode each step runs only if its toggle
 * is set. forLevel() gives the toggles each preset uses.
 */
struct CompressionConfig {
    CompressionLevel level = CompressionLevel::BALANCED;
    bool strip_line_comments = true;
    bool strip_block_comments = true;
    bool strip_docstrings = false;
    bool collapse_blank_lines = true;
    bool normalize_whitespace = false;
    bool trim_trailing_whitespace = true;
    bool preserve_imports = true;
    bool preserve_signatures = true;
    uint32_t max_consecutive_blank_lines = 1;  ///< Blank lines kept per run, 0 = unlimited

    static CompressionConfig forLevel(CompressionLevel level);
};

/**
 * @brief Rule-based lossy compressor for source text
 *
 * Comment and docstring removal tracks string literals, so comment
 * markers inside quotes are left alone. Single and double quoted
 * literals end at a newline; backtick literals may span lines.
 * Unterminated comments and strings run to the end of the input.
 * A line left blank only because a comment or docstring was removed
 * from it is dropped.
 */
class Compressor {
public:
    explicit Compressor(CompressionConfig config = CompressionConfig())
        : m_config(config) {}

    /**
     * @brief Compress text with this compressor's configuration
     * @param source Input text
     * @param language Source language, selects comment syntax
     * @return Compressed text
     */
    std::string compress(const std::string& source, Language language) const;

    /**
     * @brief Compress text with the defaults of a level
     */
    static std::string compress(const std::string& source, CompressionLevel level, Language language);

    const CompressionConfig& getConfig() const { return m_config; }

    /**
     * @brief Check if a trimmed line is an import/include/use declaration
     */
    static bool isImportStatement(const std::string& line, Language language);

    /**
     * @brief Check if a trimmed line opens a function, class or type definition
     */
    static bool isDefinitionStart(const std::string& line, Language language);

    static std::string levelName(CompressionLevel level);
    static bool parseLevel(const std::string& name, CompressionLevel& level);
    static std::string description(CompressionLevel level);

    /**
     * @brief Typical size reduction of a level, in percent
     */
    static int expectedReduction(CompressionLevel level);

    static std::string languageName(Language language);

    /**
     * @brief Map a language tag ("python", "tsx", "cpp", ...) to a Language
     */
    static Language languageFromTag(const std::string& tag);

    /**
     * @brief Map a file name to a Language through its extension
     */
    static Language languageFromFilename(const std::string& filename);

private:
    struct Line {
        std::string text;
        bool removed = false;
    };

    CompressionConfig m_config;

    std::vector<Line> stripComments(const std::string& source, Language language) const;
    std::string rewriteLines(const std::vector<Line>& lines) const;
    std::string extractSymbols(const std::string& source, Language language) const;
};

} // namespace Infiniloom
