/**
 * @file CommitMessageGenerator.hpp
 * @brief Deterministic Conventional-Commits message for a ChangeSet.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/ChangeSet.hpp"

namespace notesync::domain {

class CommitMessageGenerator {
public:
    /**
     * @brief Builds the commit message for one sync pass.
     *
     * Precedence: initial sync of one document, initial sync of several,
     * one changed group, several groups, root files only, generic fallback.
     *
     * @param changes Classified working-tree changes.
     * @param syncedDocuments Directory names of the documents rendered in this pass.
     * @param isInitial True when the repository has no commits yet.
     * @return Subject line, optionally followed by a blank line and a body line.
     */
    static std::string Generate(const ChangeSet& changes,
                                const std::vector<std::string>& syncedDocuments,
                                bool isInitial);

    /**
     * @brief Trims the scope and caps it at 30 characters (27 + "...").
     * Never returns an empty scope; falls back to "docs".
     */
    static std::string SanitizeScope(const std::string& scope);

    /** @brief Describes what happened inside a single group. */
    static std::string DescribeGroupAction(const ChangeSet& changes, const std::string& group);

    static constexpr size_t kMaxScopeLength = 30;
    static constexpr const char* kDefaultScope = "docs";
    static constexpr const char* kContentFile = "readme.md";
};

} // namespace notesync::domain
