/**
 * @file SyncPolicy.cpp
 * @brief Implementation of SyncPolicy.
 */

#include "domain/SyncPolicy.hpp"

namespace notesync::domain {

bool SyncPolicy::ShouldSync(const RemoteDocument& document, const DocumentState* prior, bool force) {
    if (force) return true;
    if (!prior) return true;

    auto recorded = Timestamp::Parse(prior->lastEditedTime);
    if (!recorded) return true;

    return document.lastEditedTime > *recorded;
}

DocumentState SyncPolicy::Record(const RemoteDocument& document, const std::string& directory, TimePoint syncedAt) {
    DocumentState state;
    state.pageId = document.id;
    state.title = document.title;
    state.directory = directory;
    state.lastEditedTime = Timestamp::ToIso8601(document.lastEditedTime);
    state.lastSyncedTime = Timestamp::ToIso8601(syncedAt);
    return state;
}

} // namespace notesync::domain
