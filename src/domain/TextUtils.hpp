/**
 * @file TextUtils.hpp
 * @brief String helpers shared by the domain, rendering and configuration code.
 */

#pragma once
#include <string>
#include <vector>

namespace notesync::domain {

class TextUtils {
public:
    /** @brief Strips spaces, tabs and line terminators from both ends. */
    static std::string Trim(const std::string& s);

    /** @brief ASCII-only lowercasing; other bytes are left untouched. */
    static std::string ToLower(std::string s);

    static std::string Join(const std::vector<std::string>& parts, const std::string& separator);

    /**
     * @brief Splits on '\n', keeping empty lines (a trailing newline yields a final empty entry).
     */
    static std::vector<std::string> SplitLines(const std::string& text);

    static void ReplaceAll(std::string& s, const std::string& from, const std::string& to);

    /**
     * @brief Decodes the UTF-8 sequence starting at @p pos and advances past it.
     * @return False for a malformed sequence; @p pos then skips one byte.
     */
    static bool NextCodePoint(const std::string& text, size_t& pos, char32_t& codePoint);

    static std::string EncodeUtf8(char32_t codePoint);

    /**
     * @brief True for letters and digits of the alphabetic scripts (Latin, Greek, Cyrillic,
     *        Hebrew, Arabic, Indic, CJK, Hangul...). Punctuation, symbols and emoji are excluded.
     */
    static bool IsWordCodePoint(char32_t codePoint);

    /** @brief True for Unicode whitespace such as NBSP and the U+2000 spaces. */
    static bool IsSpaceCodePoint(char32_t codePoint);

    /** @brief Simple case mapping for Latin-1, Greek and Cyrillic capitals. */
    static char32_t ToLowerCodePoint(char32_t codePoint);
};

} // namespace notesync::domain
