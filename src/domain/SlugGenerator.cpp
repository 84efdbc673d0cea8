/**
 * @file SlugGenerator.cpp
 * @brief Implementation of SlugGenerator.
 */

#include "domain/SlugGenerator.hpp"
#include "domain/TextUtils.hpp"

namespace notesync::domain {

namespace {

const std::string kEnDash = "\xE2\x80\x93";
const std::string kEmDash = "\xE2\x80\x94";

} // namespace

const std::map<std::string, std::string>& SlugGenerator::BuiltinOverrides() {
    static const std::map<std::string, std::string> table = {
        {"linux", "linux"},
        {"ssh", "ssh-secure-shell"},
        {"ssh " + kEnDash + " secure shell", "ssh-secure-shell"},
        {"git", "git-github"},
        {"git & github", "git-github"},
        {"aws", "aws"},
        {"aws " + kEnDash + " amazon web services", "aws"},
        {"docker", "docker"},
        {"kubernetes", "kubernetes"},
        {"jenkins", "jenkins"},
        {"spring boot", "spring-boot"},
    };
    return table;
}

SlugGenerator::SlugGenerator(const std::map<std::string, std::string>& overrides)
    : m_overrides(BuiltinOverrides()) {
    for (const auto& [title, directory] : overrides) {
        m_overrides[TextUtils::ToLower(title)] = directory;
    }
}

std::string SlugGenerator::directoryFor(const std::string& title) const {
    auto it = m_overrides.find(TextUtils::ToLower(title));
    if (it != m_overrides.end()) {
        return it->second;
    }
    return Slugify(title);
}

std::string SlugGenerator::Slugify(const std::string& title) {
    std::string text = title;
    TextUtils::ReplaceAll(text, kEnDash, "-");
    TextUtils::ReplaceAll(text, kEmDash, "-");
    TextUtils::ReplaceAll(text, "&", "-");

    std::string slug;
    bool pendingHyphen = false;
    size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        if (!TextUtils::NextCodePoint(text, pos, cp)) continue;
        if (TextUtils::IsSpaceCodePoint(cp) || cp == U'_' || cp == U'-') {
            pendingHyphen = true;
            continue;
        }
        // Punctuation, symbols and emoji are dropped without separating words.
        if (!TextUtils::IsWordCodePoint(cp)) continue;
        if (pendingHyphen && !slug.empty()) slug += '-';
        pendingHyphen = false;
        slug += TextUtils::EncodeUtf8(TextUtils::ToLowerCodePoint(cp));
    }
    return slug;
}

} // namespace notesync::domain
