/**
 * @file DocumentState.hpp
 * @brief Persisted sync bookkeeping, per document and for the whole store.
 */

#pragma once
#include <map>
#include <optional>
#include <string>

namespace notesync::domain {

/**
 * @struct DocumentState
 * @brief What the last successful render of a document looked like.
 */
struct DocumentState {
    std::string pageId;
    std::string title;
    std::string directory;
    std::string lastEditedTime;             ///< ISO-8601 remote modification time.
    std::string lastSyncedTime;             ///< ISO-8601 local sync time.
    std::optional<std::string> contentHash; ///< Reserved, currently always empty.
};

/**
 * @struct SyncState
 * @brief Whole state store: versioned mapping of page id to DocumentState.
 */
struct SyncState {
    static constexpr const char* kCurrentVersion = "1.0";

    std::string version = kCurrentVersion;
    std::optional<std::string> lastSyncTime;
    std::map<std::string, DocumentState> pages;

    const DocumentState* find(const std::string& pageId) const {
        auto it = pages.find(pageId);
        return it != pages.end() ? &it->second : nullptr;
    }
};

} // namespace notesync::domain
