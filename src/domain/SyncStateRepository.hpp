/**
 * @file SyncStateRepository.hpp
 * @brief Interface for loading and saving the sync state store.
 */

#pragma once
#include "domain/DocumentState.hpp"

namespace notesync::domain {

class SyncStateRepository {
public:
    virtual ~SyncStateRepository() = default;

    /**
     * @brief Reads the store. A missing or unreadable store yields an empty one.
     */
    virtual SyncState load() = 0;

    /** @brief Persists the whole store atomically. @return False if the write failed. */
    virtual bool save(const SyncState& state) = 0;

    /** @brief Inserts or overwrites one document's record in the given store. */
    static void Merge(SyncState& state, const DocumentState& document) {
        state.pages[document.pageId] = document;
    }

    /** @brief Clears every record and persists the empty store. */
    virtual bool reset() {
        return save(SyncState{});
    }
};

} // namespace notesync::domain
