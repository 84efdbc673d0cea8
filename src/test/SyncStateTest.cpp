#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include "domain/SyncPolicy.hpp"
#include "domain/Timestamp.hpp"
#include "infrastructure/JsonSyncStateRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace notesync::domain;
using notesync::infrastructure::JsonSyncStateRepository;
using notesync::infrastructure::PersistenceService;

namespace fs = std::filesystem;

namespace {

RemoteDocument Document(const std::string& id, const std::string& edited) {
    RemoteDocument doc;
    doc.id = id;
    doc.title = "Linux";
    doc.lastEditedTime = *Timestamp::Parse(edited);
    doc.createdTime = doc.lastEditedTime;
    doc.url = "https://www.notion.so/" + id;
    return doc;
}

void TestTimestamps() {
    std::cout << "[Test] Timestamp parsing..." << std::endl;
    auto zulu = Timestamp::Parse("2024-03-01T10:15:00.000Z");
    auto offset = Timestamp::Parse("2024-03-01T12:15:00+02:00");
    assert(zulu && offset && *zulu == *offset);
    assert(Timestamp::ToIso8601(*zulu) == "2024-03-01T10:15:00+00:00");
    assert(Timestamp::ToDisplay(*zulu) == "2024-03-01 10:15");

    auto fractional = Timestamp::Parse("2024-03-01T10:15:00.250000+00:00");
    assert(fractional && Timestamp::ToIso8601(*fractional) == "2024-03-01T10:15:00.250000+00:00");

    assert(!Timestamp::Parse("yesterday"));
    assert(!Timestamp::Parse("2024-13-01T00:00:00Z"));
    std::cout << "[PASS] ISO-8601 round trip." << std::endl;
}

void TestShouldSync() {
    std::cout << "[Test] Skip decision..." << std::endl;
    RemoteDocument doc = Document("abc", "2024-03-01T10:15:00.000Z");

    assert(SyncPolicy::ShouldSync(doc, nullptr, false));

    DocumentState same = SyncPolicy::Record(doc, "linux");
    assert(!SyncPolicy::ShouldSync(doc, &same, false));
    assert(SyncPolicy::ShouldSync(doc, &same, true));

    RemoteDocument newer = Document("abc", "2024-03-01T10:16:00.000Z");
    assert(SyncPolicy::ShouldSync(newer, &same, false));

    RemoteDocument older = Document("abc", "2024-02-01T00:00:00.000Z");
    assert(!SyncPolicy::ShouldSync(older, &same, false));

    DocumentState corrupt = same;
    corrupt.lastEditedTime = "not a time";
    assert(SyncPolicy::ShouldSync(doc, &corrupt, false));
    std::cout << "[PASS] Strictly-later rule, force and unparseable state." << std::endl;
}

void TestRepositoryRoundTrip(const fs::path& root) {
    std::cout << "[Test] State file round trip..." << std::endl;
    auto persistence = std::make_shared<PersistenceService>();
    JsonSyncStateRepository repo((root / ".notion-sync" / "state.json").string(), persistence);

    SyncState empty = repo.load();
    assert(empty.pages.empty());
    assert(empty.version == "1.0");

    SyncState state;
    state.lastSyncTime = "2024-03-02T00:00:00+00:00";
    SyncStateRepository::Merge(state, SyncPolicy::Record(Document("abc", "2024-03-01T10:15:00Z"), "linux",
                                                         *Timestamp::Parse("2024-03-01T11:00:00Z")));
    DocumentState hashed = SyncPolicy::Record(Document("def", "2024-03-01T09:00:00Z"), "aws");
    hashed.title = "AWS";
    hashed.contentHash = "deadbeef";
    SyncStateRepository::Merge(state, hashed);
    assert(repo.save(state));

    SyncState loaded = repo.load();
    assert(loaded.version == "1.0");
    assert(loaded.lastSyncTime == state.lastSyncTime);
    assert(loaded.pages.size() == 2);
    const DocumentState* record = loaded.find("abc");
    assert(record);
    assert(record->title == "Linux");
    assert(record->directory == "linux");
    assert(record->lastEditedTime == "2024-03-01T10:15:00+00:00");
    assert(record->lastSyncedTime == "2024-03-01T11:00:00+00:00");
    assert(!record->contentHash);
    assert(loaded.find("def")->contentHash == std::optional<std::string>("deadbeef"));

    // Merge overwrites, never duplicates.
    SyncStateRepository::Merge(loaded, SyncPolicy::Record(Document("abc", "2024-04-01T00:00:00Z"), "linux"));
    assert(loaded.pages.size() == 2);
    assert(loaded.find("abc")->lastEditedTime == "2024-04-01T00:00:00+00:00");

    auto raw = nlohmann::json::parse(*persistence->readText(repo.path()));
    assert(raw["pages"]["abc"]["content_hash"].is_null());

    assert(repo.reset());
    assert(repo.load().pages.empty());
    std::cout << "[PASS] Every field survives save and load." << std::endl;
}

void TestRepositoryTolerance(const fs::path& root) {
    std::cout << "[Test] Corrupt and extended state files..." << std::endl;
    auto persistence = std::make_shared<PersistenceService>();
    const fs::path file = root / "tolerance" / "state.json";
    JsonSyncStateRepository repo(file.string(), persistence);

    assert(persistence->saveText(file.string(), "{ this is not json"));
    assert(repo.load().pages.empty());

    assert(persistence->saveText(file.string(), R"({"version": "1.0", "pages": {"abc": {"title": "x"}}})"));
    assert(repo.load().pages.empty());

    assert(persistence->saveText(file.string(), R"({
        "version": "1.0",
        "last_sync_time": null,
        "schema_note": "extra",
        "pages": {
            "abc": {
                "page_id": "abc", "title": "Linux", "directory": "linux",
                "last_edited_time": "2024-03-01T10:15:00+00:00",
                "last_synced_time": "2024-03-01T11:00:00+00:00",
                "content_hash": null, "pinned": true
            }
        }
    })"));
    SyncState loaded = repo.load();
    assert(loaded.pages.size() == 1);
    assert(!loaded.lastSyncTime);
    assert(loaded.find("abc")->directory == "linux");
    std::cout << "[PASS] Corrupt file loads empty; unknown fields ignored." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SyncState Test..." << std::endl;

    const fs::path testRoot = "test_project_root_state";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    TestTimestamps();
    TestShouldSync();
    TestRepositoryRoundTrip(testRoot);
    TestRepositoryTolerance(testRoot);

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
