/**
 * @file JsonSyncStateRepository.cpp
 * @brief Implementation of JsonSyncStateRepository.
 */

#include "infrastructure/JsonSyncStateRepository.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace notesync::infrastructure {

namespace {

json OptionalToJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> OptionalFromJson(const json& object, const char* key) {
    if (object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

JsonSyncStateRepository::JsonSyncStateRepository(const std::string& stateFile,
                                                 std::shared_ptr<PersistenceService> persistence)
    : m_stateFile(stateFile), m_persistence(std::move(persistence)) {}

json JsonSyncStateRepository::ToJson(const domain::SyncState& state) {
    json pages = json::object();
    for (const auto& [id, page] : state.pages) {
        pages[id] = {
            {"page_id", page.pageId},
            {"title", page.title},
            {"directory", page.directory},
            {"last_edited_time", page.lastEditedTime},
            {"last_synced_time", page.lastSyncedTime},
            {"content_hash", OptionalToJson(page.contentHash)}
        };
    }
    return {
        {"version", state.version},
        {"last_sync_time", OptionalToJson(state.lastSyncTime)},
        {"pages", pages}
    };
}

domain::SyncState JsonSyncStateRepository::FromJson(const json& data) {
    domain::SyncState state;
    if (!data.is_object()) {
        throw std::runtime_error("state root must be an object");
    }
    if (auto version = OptionalFromJson(data, "version")) {
        state.version = *version;
    }
    state.lastSyncTime = OptionalFromJson(data, "last_sync_time");

    if (data.contains("pages") && data["pages"].is_object()) {
        for (auto it = data["pages"].begin(); it != data["pages"].end(); ++it) {
            const auto& page = it.value();
            domain::DocumentState record;
            record.pageId = page.at("page_id").get<std::string>();
            record.title = page.at("title").get<std::string>();
            record.directory = page.at("directory").get<std::string>();
            record.lastEditedTime = page.at("last_edited_time").get<std::string>();
            record.lastSyncedTime = page.at("last_synced_time").get<std::string>();
            record.contentHash = OptionalFromJson(page, "content_hash");
            state.pages[it.key()] = record;
        }
    }
    return state;
}

domain::SyncState JsonSyncStateRepository::load() {
    if (!std::filesystem::exists(m_stateFile)) {
        return {};
    }

    auto text = m_persistence->readText(m_stateFile);
    if (!text) {
        std::cerr << "[StateRepository] Warning: Could not read state file " << m_stateFile << std::endl;
        return {};
    }

    try {
        return FromJson(json::parse(*text));
    } catch (const std::exception& e) {
        std::cerr << "[StateRepository] Warning: Could not load state file: " << e.what() << std::endl;
        return {};
    }
}

bool JsonSyncStateRepository::save(const domain::SyncState& state) {
    return m_persistence->saveText(m_stateFile, ToJson(state).dump(2) + "\n");
}

} // namespace notesync::infrastructure
