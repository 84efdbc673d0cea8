/**
 * @file SyncService.cpp
 * @brief Implementation of SyncService.
 */

#include "application/SyncService.hpp"
#include "application/ExportService.hpp"
#include "domain/ChangeClassifier.hpp"
#include "domain/CommitMessageGenerator.hpp"
#include "domain/SyncPolicy.hpp"
#include "domain/TextUtils.hpp"
#include "infrastructure/AssetResolver.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace notesync::application {

namespace fs = std::filesystem;
using domain::TextUtils;

namespace {

constexpr size_t kFallbackIdLength = 8;

// Stored timestamps are ISO-8601; unparseable ones are shown verbatim.
std::string DisplayTime(const std::string& iso) {
    auto parsed = domain::Timestamp::Parse(iso);
    return parsed ? domain::Timestamp::ToDisplay(*parsed) : iso;
}

} // namespace

SyncService::SyncService(std::shared_ptr<domain::DocumentSource> source,
                         std::shared_ptr<domain::VersionControl> vcs,
                         std::shared_ptr<domain::SyncStateRepository> stateRepository,
                         std::shared_ptr<infrastructure::PersistenceService> persistence,
                         domain::SlugGenerator slugs,
                         SyncOptions options)
    : m_source(std::move(source))
    , m_vcs(std::move(vcs))
    , m_stateRepository(std::move(stateRepository))
    , m_persistence(std::move(persistence))
    , m_slugs(std::move(slugs))
    , m_options(std::move(options))
{}

std::string SyncService::directoryFor(const domain::RemoteDocument& document) const {
    std::string directory = m_slugs.directoryFor(document.title);
    if (directory.empty()) {
        directory = "page-" + document.id.substr(0, kFallbackIdLength);
    }
    return directory;
}

SyncResult SyncService::sync() {
    SyncResult result;
    std::cout << "[SyncService] Starting sync" << std::endl;

    if (!m_vcs->isRepository()) {
        m_vcs->initRepository();
    }
    m_vcs->configureUser(m_options.gitUserName, m_options.gitUserEmail);
    const bool isInitial = !m_vcs->hasCommits();

    domain::SyncState state = m_stateRepository->load();

    std::vector<domain::RemoteDocument> documents;
    try {
        documents = m_source->listChildDocuments(m_options.parentPageId);
        std::cout << "[SyncService] Found " << documents.size() << " pages" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[SyncService] Failed to fetch pages: " << e.what() << std::endl;
        result.failed.push_back(kDiscoveryFailure);
        return result;
    }

    if (documents.empty()) {
        std::cerr << "[SyncService] No pages found under the parent page." << std::endl;
        std::cerr << "[SyncService] Make sure the integration has access to the pages." << std::endl;
        return result;
    }

    std::vector<std::string> syncedDirectories;
    for (const auto& document : documents) {
        if (m_options.cancelFlag && m_options.cancelFlag->load()) {
            throw SyncCancelled();
        }

        try {
            if (syncDocument(document, state, result)) {
                result.synced.push_back(document.title);
                syncedDirectories.push_back(directoryFor(document));
            } else {
                result.skipped.push_back(document.title);
            }
        } catch (const std::exception& e) {
            std::cerr << "[SyncService] Failed to sync '" << document.title << "': " << e.what() << std::endl;
            result.failed.push_back(document.title);
        }
    }

    writeIndex(documents);
    commitChanges(syncedDirectories, isInitial, result);

    state.lastSyncTime = domain::Timestamp::ToIso8601(domain::Timestamp::Now());
    if (!m_stateRepository->save(state)) {
        std::cerr << "[SyncService] Warning: Could not save sync state" << std::endl;
    }

    printSummary(result);
    return result;
}

bool SyncService::syncDocument(const domain::RemoteDocument& document, domain::SyncState& state, SyncResult& result) {
    const std::string directory = directoryFor(document);

    if (!domain::SyncPolicy::ShouldSync(document, state.find(document.id), m_options.force)) {
        std::cout << "[SyncService] Skipping " << document.title << " (unchanged)" << std::endl;
        return false;
    }
    std::cout << "[SyncService] Syncing: " << document.title << std::endl;

    std::vector<domain::Block> blocks = m_source->fetchBlockTree(document.id);

    const fs::path documentDir = fs::path(m_options.repoRoot) / directory;
    const fs::path assetDir = documentDir / kAssetDirName;
    fs::create_directories(assetDir);

    infrastructure::AssetResolver assets(
        [this](const std::string& url) { return m_source->fetchBinary(url); },
        m_persistence);
    MarkdownRenderer renderer([&assets](const std::string& url, const std::string& targetDir) {
        return assets.resolve(url, targetDir);
    });

    RenderResult rendered = renderer.render(blocks, assetDir.string(), kAssetDirName);
    const std::string content = ExportService::ComposeDocument(document, rendered.text);

    const fs::path contentPath = documentDir / kContentFile;
    if (!m_persistence->saveText(contentPath.string(), content)) {
        throw std::runtime_error("could not write " + contentPath.string());
    }

    result.assetsDownloaded += static_cast<int>(rendered.assets.size());
    domain::SyncStateRepository::Merge(state, domain::SyncPolicy::Record(document, directory));
    return true;
}

void SyncService::writeIndex(const std::vector<domain::RemoteDocument>& documents) {
    const std::string index = ExportService::ComposeIndex(
        documents, [this](const domain::RemoteDocument& document) { return directoryFor(document); },
        domain::Timestamp::Now());
    const fs::path indexPath = fs::path(m_options.repoRoot) / kContentFile;
    if (!m_persistence->saveText(indexPath.string(), index)) {
        std::cerr << "[SyncService] Warning: Could not write index " << indexPath << std::endl;
    }
}

void SyncService::commitChanges(const std::vector<std::string>& syncedDirectories, bool isInitial, SyncResult& result) {
    try {
        domain::ChangeSet changes = domain::ChangeClassifier::Classify(m_vcs->detectStatus());
        if (!changes.hasChanges()) {
            std::cout << "[SyncService] No changes to commit" << std::endl;
            return;
        }

        m_vcs->stageAll();
        const std::string message = domain::CommitMessageGenerator::Generate(changes, syncedDirectories, isInitial);
        result.commitCreated = m_vcs->commit(message);

        if (m_options.push && result.commitCreated) {
            result.pushed = m_vcs->push(m_options.gitRemote, m_options.gitBranch);
        }
    } catch (const std::exception& e) {
        std::cerr << "[SyncService] Git operation failed: " << e.what() << std::endl;
        result.failed.push_back(kGitFailure);
    }
}

void SyncService::printSummary(const SyncResult& result) const {
    const std::string rule(50, '=');
    std::cout << "\n" << rule << "\nSync Summary\n" << rule << "\n";
    std::cout << std::left;
    std::cout << std::setw(20) << "Pages synced" << result.synced.size() << "\n";
    std::cout << std::setw(20) << "Pages skipped" << result.skipped.size() << "\n";
    std::cout << std::setw(20) << "Pages failed" << result.failed.size() << "\n";
    std::cout << std::setw(20) << "Images downloaded" << result.assetsDownloaded << "\n";
    std::cout << std::setw(20) << "Commit created" << (result.commitCreated ? "yes" : "no") << "\n";
    std::cout << std::setw(20) << "Pushed to remote" << (result.pushed ? "yes" : "no") << "\n";
    std::cout << std::setw(20) << "API requests" << m_source->requestCount() << "\n";

    if (!result.synced.empty()) {
        std::cout << "\nSynced: " << TextUtils::Join(result.synced, ", ") << "\n";
    }
    if (!result.failed.empty()) {
        std::cout << "\nFailed: " << TextUtils::Join(result.failed, ", ") << "\n";
    }
    std::cout << std::endl;
}

void SyncService::printStatus(std::ostream& out) const {
    domain::SyncState state = m_stateRepository->load();
    out << "Sync Status\n\n";

    if (state.pages.empty()) {
        out << "No pages have been synced yet.\n";
        out << "Run 'notesync sync' to perform the initial sync.\n";
        return;
    }

    std::vector<domain::DocumentState> pages;
    for (const auto& [id, page] : state.pages) {
        pages.push_back(page);
    }
    std::sort(pages.begin(), pages.end(), [](const auto& a, const auto& b) { return a.title < b.title; });

    out << std::left
        << std::setw(32) << "Page" << std::setw(28) << "Directory"
        << std::setw(20) << "Last Edited" << "Last Synced\n";
    for (const auto& page : pages) {
        out << std::setw(32) << page.title << std::setw(28) << page.directory
            << std::setw(20) << DisplayTime(page.lastEditedTime) << DisplayTime(page.lastSyncedTime) << "\n";
    }

    if (state.lastSyncTime) {
        out << "\nLast sync: " << DisplayTime(*state.lastSyncTime) << " UTC\n";
    }
}

void SyncService::clean() {
    domain::SyncState state = m_stateRepository->load();

    for (const auto& [id, page] : state.pages) {
        if (page.directory.empty()) continue;
        const fs::path documentDir = fs::path(m_options.repoRoot) / page.directory;
        std::error_code ec;
        if (fs::exists(documentDir, ec)) {
            fs::remove_all(documentDir, ec);
            if (ec) {
                std::cerr << "[SyncService] Could not remove " << documentDir << ": " << ec.message() << std::endl;
            } else {
                std::cout << "[SyncService] Removed: " << documentDir.string() << std::endl;
            }
        }
    }

    const fs::path index = fs::path(m_options.repoRoot) / kContentFile;
    std::error_code ec;
    if (fs::remove(index, ec)) {
        std::cout << "[SyncService] Removed: " << index.string() << std::endl;
    }

    if (!m_stateRepository->reset()) {
        throw std::runtime_error("could not reset sync state");
    }
    std::cout << "[SyncService] Clean complete." << std::endl;
}

} // namespace notesync::application
