/**
 * @file JsonSyncStateRepository.hpp
 * @brief SyncStateRepository persisted as a JSON file.
 */

#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/SyncStateRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace notesync::infrastructure {

/**
 * @class JsonSyncStateRepository
 * @brief Stores the sync state in a single JSON document.
 *
 * Format:
 * {
 *   "version": "1.0",
 *   "last_sync_time": "...",
 *   "pages": { "<id>": { "page_id", "title", "directory",
 *                        "last_edited_time", "last_synced_time", "content_hash" } }
 * }
 * Unknown fields are ignored on read. Absent optionals are written as null.
 */
class JsonSyncStateRepository : public domain::SyncStateRepository {
public:
    JsonSyncStateRepository(const std::string& stateFile, std::shared_ptr<PersistenceService> persistence);

    domain::SyncState load() override;
    bool save(const domain::SyncState& state) override;

    static nlohmann::json ToJson(const domain::SyncState& state);

    /** @throws std::exception when the root is not an object or a page record lacks a required field. */
    static domain::SyncState FromJson(const nlohmann::json& data);

    const std::string& path() const { return m_stateFile; }

private:
    std::string m_stateFile;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace notesync::infrastructure
