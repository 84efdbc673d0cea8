/**
 * @file TextUtils.cpp
 * @brief Implementation of TextUtils.
 */

#include "domain/TextUtils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace notesync::domain {

namespace {

// Inclusive ranges of non-ASCII letters and digits. Script punctuation inside
// the blocks (Greek question mark, Arabic comma, danda...) is cut out.
constexpr std::array<std::pair<char32_t, char32_t>, 39> kWordRanges = {{
    {0x00AA, 0x00AA}, {0x00B5, 0x00B5}, {0x00BA, 0x00BA},
    {0x00C0, 0x00D6}, {0x00D8, 0x00F6}, {0x00F8, 0x02FF},
    {0x0370, 0x037D}, {0x037F, 0x0386}, {0x0388, 0x0481}, {0x048A, 0x0559},
    {0x0560, 0x0588}, {0x05D0, 0x05F2},
    {0x0620, 0x064A}, {0x0660, 0x0669}, {0x066E, 0x06D3}, {0x06D5, 0x06FF},
    {0x0900, 0x0963}, {0x0966, 0x0DFF}, {0x0E00, 0x0E4E}, {0x0E50, 0x0E59},
    {0x0E80, 0x10FA}, {0x10FC, 0x135F}, {0x1369, 0x1FFF},
    {0x2C00, 0x2DFF},
    {0x3041, 0x30FA}, {0x30FC, 0x30FF}, {0x3105, 0x318F}, {0x31A0, 0x31FF},
    {0x3400, 0x4DBF}, {0x4E00, 0x9FFF}, {0xA000, 0xA4CF}, {0xAC00, 0xD7A3},
    {0xF900, 0xFAFF},
    {0xFF10, 0xFF19}, {0xFF21, 0xFF3A}, {0xFF41, 0xFF5A}, {0xFF66, 0xFFDC},
    {0x20000, 0x2FA1F}, {0x30000, 0x3134F},
}};

} // namespace

std::string TextUtils::Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string TextUtils::ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string TextUtils::Join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

std::vector<std::string> TextUtils::SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    while (true) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

void TextUtils::ReplaceAll(std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool TextUtils::NextCodePoint(const std::string& text, size_t& pos, char32_t& codePoint) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    size_t length = 0;
    if (lead < 0x80) {
        codePoint = lead;
        length = 1;
    } else if ((lead & 0xE0) == 0xC0) {
        codePoint = lead & 0x1F;
        length = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        codePoint = lead & 0x0F;
        length = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        codePoint = lead & 0x07;
        length = 4;
    } else {
        ++pos;
        return false;
    }

    if (pos + length > text.size()) {
        ++pos;
        return false;
    }
    for (size_t i = 1; i < length; ++i) {
        const auto next = static_cast<unsigned char>(text[pos + i]);
        if ((next & 0xC0) != 0x80) {
            ++pos;
            return false;
        }
        codePoint = (codePoint << 6) | (next & 0x3F);
    }
    pos += length;
    return true;
}

std::string TextUtils::EncodeUtf8(char32_t codePoint) {
    std::string out;
    if (codePoint < 0x80) {
        out += static_cast<char>(codePoint);
    } else if (codePoint < 0x800) {
        out += static_cast<char>(0xC0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else if (codePoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codePoint >> 18));
        out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
    return out;
}

bool TextUtils::IsWordCodePoint(char32_t codePoint) {
    if (codePoint < 0x80) {
        return std::isalnum(static_cast<unsigned char>(codePoint)) != 0;
    }
    for (const auto& [first, last] : kWordRanges) {
        if (codePoint < first) return false;
        if (codePoint <= last) return true;
    }
    return false;
}

bool TextUtils::IsSpaceCodePoint(char32_t codePoint) {
    if (codePoint < 0x80) {
        return std::isspace(static_cast<unsigned char>(codePoint)) != 0;
    }
    return codePoint == 0x00A0 || codePoint == 0x1680 ||
           (codePoint >= 0x2000 && codePoint <= 0x200A) ||
           codePoint == 0x2028 || codePoint == 0x2029 ||
           codePoint == 0x202F || codePoint == 0x205F || codePoint == 0x3000;
}

char32_t TextUtils::ToLowerCodePoint(char32_t codePoint) {
    if (codePoint < 0x80) {
        return static_cast<char32_t>(std::tolower(static_cast<unsigned char>(codePoint)));
    }
    if (codePoint >= 0x00C0 && codePoint <= 0x00DE && codePoint != 0x00D7) return codePoint + 0x20;
    if (codePoint >= 0x0391 && codePoint <= 0x03A9 && codePoint != 0x03A2) return codePoint + 0x20;
    if (codePoint >= 0x0410 && codePoint <= 0x042F) return codePoint + 0x20;
    if (codePoint >= 0x0400 && codePoint <= 0x040F) return codePoint + 0x50;
    return codePoint;
}

} // namespace notesync::domain
