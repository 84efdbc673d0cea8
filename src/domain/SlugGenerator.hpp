/**
 * @file SlugGenerator.hpp
 * @brief Deterministic directory names for document titles.
 */

#pragma once
#include <map>
#include <string>

namespace notesync::domain {

/**
 * @class SlugGenerator
 * @brief Maps a title to a filesystem-safe directory name.
 *
 * Examples:
 *   "Linux" -> "linux"
 *   "SSH – Secure Shell" -> "ssh-secure-shell"
 *   "Git & GitHub" -> "git-github"
 *   "Rust: Ownership & Borrowing" -> "rust-ownership-borrowing"
 */
class SlugGenerator {
public:
    /**
     * @param overrides Extra lowercase-title -> directory entries, applied over the built-in table.
     */
    explicit SlugGenerator(const std::map<std::string, std::string>& overrides = {});

    std::string directoryFor(const std::string& title) const;

    /** @brief Generic rule without the override table. */
    static std::string Slugify(const std::string& title);

    static const std::map<std::string, std::string>& BuiltinOverrides();

private:
    std::map<std::string, std::string> m_overrides;
};

} // namespace notesync::domain
