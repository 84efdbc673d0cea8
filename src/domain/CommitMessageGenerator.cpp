/**
 * @file CommitMessageGenerator.cpp
 * @brief Implementation of CommitMessageGenerator.
 */

#include "domain/CommitMessageGenerator.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace notesync::domain {

namespace {

std::string JoinSorted(std::vector<std::string> names) {
    std::sort(names.begin(), names.end());
    return TextUtils::Join(names, ", ");
}

std::string ImageCount(size_t count) {
    return std::to_string(count) + (count > 1 ? " images" : " image");
}

} // namespace

std::string CommitMessageGenerator::SanitizeScope(const std::string& scope) {
    const char* ws = " \t\r\n";
    size_t start = scope.find_first_not_of(ws);
    if (start == std::string::npos) return kDefaultScope;
    std::string sanitized = scope.substr(start, scope.find_last_not_of(ws) - start + 1);

    if (sanitized.size() > kMaxScopeLength) {
        sanitized = sanitized.substr(0, kMaxScopeLength - 3) + "...";
    }
    return sanitized;
}

std::string CommitMessageGenerator::DescribeGroupAction(const ChangeSet& changes, const std::string& group) {
    auto groupChanges = changes.inGroup(group);

    size_t imagesAdded = 0;
    bool contentChanged = false;
    bool allAdded = true;
    for (const auto& change : groupChanges) {
        if (change.kind == ChangeKind::Added && change.isImage()) ++imagesAdded;
        if (TextUtils::ToLower(change.filename()) == kContentFile) contentChanged = true;
        if (change.kind != ChangeKind::Added) allAdded = false;
    }

    if (allAdded) {
        if (imagesAdded > 0) {
            return "initial sync with " + std::to_string(imagesAdded) + " images";
        }
        return "initial sync";
    }
    if (imagesAdded > 0 && contentChanged) {
        return "update content and add " + ImageCount(imagesAdded);
    }
    if (imagesAdded > 0) {
        return "add " + ImageCount(imagesAdded);
    }
    if (contentChanged) {
        return "update content";
    }
    return "sync latest changes";
}

std::string CommitMessageGenerator::Generate(const ChangeSet& changes,
                                             const std::vector<std::string>& syncedDocuments,
                                             bool isInitial) {
    if (isInitial) {
        if (syncedDocuments.size() == 1) {
            return "docs(" + SanitizeScope(syncedDocuments.front()) + "): initial sync";
        }
        return "docs: initial sync of " + std::to_string(syncedDocuments.size()) + " topics\n\n"
               "Topics: " + JoinSorted(syncedDocuments);
    }

    auto groups = changes.groups();
    if (groups.size() == 1) {
        const std::string& group = *groups.begin();
        return "docs(" + SanitizeScope(group) + "): " + DescribeGroupAction(changes, group);
    }

    if (groups.size() > 1) {
        return "docs: sync updates across " + std::to_string(groups.size()) + " topics\n\n"
               "Updated: " + JoinSorted(std::vector<std::string>(groups.begin(), groups.end()));
    }

    // Only root-level files (the generated index) changed.
    if (changes.hasRootChanges()) {
        return "docs: update documentation index";
    }

    return "docs: sync latest changes";
}

} // namespace notesync::domain
