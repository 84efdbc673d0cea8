#include <cassert>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "application/SyncService.hpp"
#include "infrastructure/JsonSyncStateRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace notesync;
using json = nlohmann::json;

namespace fs = std::filesystem;

// In-memory document source
class FakeDocumentSource : public domain::DocumentSource {
public:
    std::vector<domain::RemoteDocument> documents;
    std::map<std::string, std::vector<domain::Block>> trees;
    std::map<std::string, std::string> binaries;
    bool failDiscovery = false;
    int treeFetches = 0;

    std::vector<domain::RemoteDocument> listChildDocuments(const std::string&) override {
        if (failDiscovery) throw std::runtime_error("HTTP 401: unauthorized");
        return documents;
    }

    std::vector<domain::Block> fetchBlockTree(const std::string& blockId) override {
        ++treeFetches;
        auto it = trees.find(blockId);
        if (it == trees.end()) throw std::runtime_error("HTTP 404: block not found");
        return it->second;
    }

    std::optional<std::string> fetchBinary(const std::string& url) override {
        auto it = binaries.find(url);
        if (it == binaries.end()) return std::nullopt;
        return it->second;
    }
};

// Records calls; status lines are supplied by the test.
class FakeVersionControl : public domain::VersionControl {
public:
    bool repository = false;
    bool commits = false;
    std::vector<std::string> status;
    std::vector<std::string> messages;
    int stageCalls = 0;
    int pushCalls = 0;
    std::string configuredName;

    bool isRepository() override { return repository; }
    void initRepository() override { repository = true; }
    void configureUser(const std::string& name, const std::string&) override { configuredName = name; }
    bool hasCommits() override { return commits; }
    std::vector<std::string> detectStatus() override { return status; }
    void stageAll() override { ++stageCalls; }
    bool commit(const std::string& message) override {
        messages.push_back(message);
        commits = true;
        return true;
    }
    bool push(const std::string&, const std::string&) override {
        ++pushCalls;
        return true;
    }
};

namespace {

domain::RemoteDocument Document(const std::string& id, const std::string& title, const std::string& edited) {
    domain::RemoteDocument doc;
    doc.id = id;
    doc.title = title;
    doc.lastEditedTime = *domain::Timestamp::Parse(edited);
    doc.createdTime = doc.lastEditedTime;
    doc.url = "https://www.notion.so/" + id;
    return doc;
}

domain::Block Paragraph(const std::string& text) {
    return domain::Block::Make("p-" + text, "paragraph",
        {{"rich_text", json::array({{{"plain_text", text}}})}});
}

struct Fixture {
    fs::path root;
    std::shared_ptr<FakeDocumentSource> source = std::make_shared<FakeDocumentSource>();
    std::shared_ptr<FakeVersionControl> vcs = std::make_shared<FakeVersionControl>();
    std::shared_ptr<infrastructure::PersistenceService> persistence = std::make_shared<infrastructure::PersistenceService>();
    std::shared_ptr<infrastructure::JsonSyncStateRepository> state;

    explicit Fixture(const fs::path& testRoot) : root(testRoot) {
        fs::remove_all(root);
        fs::create_directories(root);
        state = std::make_shared<infrastructure::JsonSyncStateRepository>(
            (root / ".notion-sync" / "state.json").string(), persistence);
    }

    application::SyncService service(bool force = false, bool push = true) {
        application::SyncOptions options;
        options.repoRoot = root.string();
        options.parentPageId = "parent";
        options.gitUserName = "Sync Bot";
        options.gitUserEmail = "bot@example.com";
        options.force = force;
        options.push = push;
        return application::SyncService(source, vcs, state, persistence, domain::SlugGenerator(), options);
    }
};

std::string ReadFile(const fs::path& path) {
    infrastructure::PersistenceService io;
    return io.readText(path.string()).value_or("");
}

void TestInitialSyncWithPartialFailure() {
    std::cout << "[Test] Initial sync with one failing page..." << std::endl;
    Fixture fx("test_project_root_sync_initial");

    fx.source->documents = {
        Document("a1", "Linux", "2024-03-01T10:00:00Z"),
        Document("b2", "Broken Page", "2024-03-01T10:00:00Z"),
        Document("c3", "Docker", "2024-03-01T10:00:00Z"),
    };
    domain::Block image = domain::Block::Make("img", "image",
        {{"type", "external"}, {"external", {{"url", "https://cdn.example.com/whale.png"}}}});
    fx.source->trees["a1"] = {Paragraph("kernel")};
    fx.source->trees["c3"] = {Paragraph("containers"), image};
    fx.source->binaries["https://cdn.example.com/whale.png"] = "PNGDATA";
    fx.vcs->status = {"?? README.md", "?? linux/README.md", "?? docker/README.md", "?? docker/images/whale.png"};

    application::SyncResult result = fx.service().sync();

    assert(fx.vcs->repository);
    assert(fx.vcs->configuredName == "Sync Bot");
    assert((result.synced == std::vector<std::string>{"Linux", "Docker"}));
    assert((result.failed == std::vector<std::string>{"Broken Page"}));
    assert(!result.success());
    assert(result.assetsDownloaded == 1);
    assert(result.commitCreated && result.pushed);

    std::string linuxPage = ReadFile(fx.root / "linux" / "README.md");
    assert(linuxPage.rfind("# Linux\n", 0) == 0);
    assert(linuxPage.find("kernel\n") != std::string::npos);

    std::string dockerPage = ReadFile(fx.root / "docker" / "README.md");
    assert(dockerPage.find("![Image](images/image-") != std::string::npos);
    assert(!fs::is_empty(fx.root / "docker" / "images"));

    std::string index = ReadFile(fx.root / "README.md");
    assert(index.find("- [📄 Broken Page](./broken-page/)") != std::string::npos);

    assert(fx.vcs->messages.size() == 1);
    assert(fx.vcs->messages[0] == "docs: initial sync of 2 topics\n\nTopics: docker, linux");

    domain::SyncState saved = fx.state->load();
    assert(saved.pages.size() == 2);
    assert(saved.find("b2") == nullptr);
    assert(saved.lastSyncTime.has_value());

    fs::remove_all(fx.root);
    std::cout << "[PASS] Failure recorded, batch continued, commit built from status." << std::endl;
}

void TestUnchangedPagesAreSkipped() {
    std::cout << "[Test] Second pass skips unchanged pages..." << std::endl;
    Fixture fx("test_project_root_sync_skip");

    fx.source->documents = {
        Document("a1", "Linux", "2024-03-01T10:00:00Z"),
        Document("b2", "AWS", "2024-03-01T10:00:00Z"),
    };
    fx.source->trees["a1"] = {Paragraph("kernel")};
    fx.source->trees["b2"] = {Paragraph("cloud")};
    fx.vcs->status = {"?? README.md", "?? linux/README.md", "?? aws/README.md"};

    assert(fx.service().sync().success());
    assert(fx.source->treeFetches == 2);

    // Only AWS changed remotely.
    fx.source->documents[1].lastEditedTime = *domain::Timestamp::Parse("2024-03-05T08:00:00Z");
    fx.source->trees["b2"] = {Paragraph("cloud v2")};
    fx.vcs->status = {" M aws/README.md", " M README.md"};

    application::SyncResult second = fx.service(false, false).sync();
    assert((second.synced == std::vector<std::string>{"AWS"}));
    assert((second.skipped == std::vector<std::string>{"Linux"}));
    assert(fx.source->treeFetches == 3);
    assert(fx.vcs->messages.back() == "docs(aws): update content");
    assert(fx.vcs->pushCalls == 1);

    // Forced pass re-renders everything.
    application::SyncResult forced = fx.service(true, false).sync();
    assert(forced.synced.size() == 2 && forced.skipped.empty());

    fs::remove_all(fx.root);
    std::cout << "[PASS] Skip decision driven by stored timestamps." << std::endl;
}

void TestDiscoveryFailureAndClean() {
    std::cout << "[Test] Discovery failure and clean..." << std::endl;
    Fixture fx("test_project_root_sync_clean");

    fx.source->failDiscovery = true;
    application::SyncResult failed = fx.service().sync();
    assert((failed.failed == std::vector<std::string>{"(page discovery)"}));
    assert(fx.vcs->stageCalls == 0);
    assert(!fs::exists(fx.root / "README.md"));

    fx.source->failDiscovery = false;
    fx.source->documents = {Document("a1", "Linux", "2024-03-01T10:00:00Z")};
    fx.source->trees["a1"] = {Paragraph("kernel")};
    fx.vcs->status = {"?? README.md", "?? linux/README.md"};
    assert(fx.service().sync().success());
    assert(fx.vcs->messages.back() == "docs(linux): initial sync");

    std::ostringstream status;
    fx.service().printStatus(status);
    assert(status.str().find("Linux") != std::string::npos);

    fx.service().clean();
    assert(!fs::exists(fx.root / "linux"));
    assert(!fs::exists(fx.root / "README.md"));
    assert(fx.state->load().pages.empty());

    std::ostringstream empty;
    fx.service().printStatus(empty);
    assert(empty.str().find("No pages have been synced yet.") != std::string::npos);

    fs::remove_all(fx.root);
    std::cout << "[PASS] Discovery failure stops the pass; clean resets state." << std::endl;
}

void TestIndexLinksMatchWrittenDirectories() {
    std::cout << "[Test] Index links for titles without a slug..." << std::endl;
    Fixture fx("test_project_root_sync_fallback");

    fx.source->documents = {
        Document("0123456789abcdef0123456789abcdef", "!!!", "2024-03-01T10:00:00Z"),
        Document("fedcba9876543210fedcba9876543210", "\xF0\x9F\x9A\x80 Launch", "2024-03-01T10:00:00Z"),
    };
    fx.source->trees["0123456789abcdef0123456789abcdef"] = {Paragraph("bang")};
    fx.source->trees["fedcba9876543210fedcba9876543210"] = {Paragraph("liftoff")};
    fx.vcs->status = {"?? README.md", "?? page-01234567/README.md", "?? launch/README.md"};

    assert(fx.service().sync().success());
    assert(fs::exists(fx.root / "page-01234567" / "README.md"));
    assert(fs::exists(fx.root / "launch" / "README.md"));

    std::string index = ReadFile(fx.root / "README.md");
    assert(index.find("- [📄 !!!](./page-01234567/)") != std::string::npos);
    assert(index.find("- [📄 \xF0\x9F\x9A\x80 Launch](./launch/)") != std::string::npos);
    assert(index.find("](.//)") == std::string::npos);

    assert(fx.state->load().find("0123456789abcdef0123456789abcdef")->directory == "page-01234567");

    fs::remove_all(fx.root);
    std::cout << "[PASS] Index links point at the directories actually written." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SyncService Test..." << std::endl;
    TestInitialSyncWithPartialFailure();
    TestUnchangedPagesAreSkipped();
    TestDiscoveryFailureAndClean();
    TestIndexLinksMatchWrittenDirectories();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
