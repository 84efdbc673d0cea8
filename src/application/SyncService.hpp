/**
 * @file SyncService.hpp
 * @brief Orchestrates one remote-to-repository synchronization pass.
 */

#pragma once

#include <atomic>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "application/MarkdownRenderer.hpp"
#include "domain/DocumentSource.hpp"
#include "domain/SlugGenerator.hpp"
#include "domain/SyncStateRepository.hpp"
#include "domain/VersionControl.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace notesync::application {

/**
 * @class SyncCancelled
 * @brief Raised between documents once cancellation was requested.
 */
class SyncCancelled : public std::runtime_error {
public:
    SyncCancelled() : std::runtime_error("Sync cancelled") {}
};

struct SyncOptions {
    std::string repoRoot;
    std::string parentPageId;
    std::string gitUserName;
    std::string gitUserEmail;
    std::string gitRemote = "origin";
    std::string gitBranch = "main";
    bool force = false;
    bool push = true;
    const std::atomic<bool>* cancelFlag = nullptr; ///< Polled before each document.
};

/**
 * @struct SyncResult
 * @brief Outcome of one pass. Documents are listed by title.
 */
struct SyncResult {
    std::vector<std::string> synced;
    std::vector<std::string> skipped;
    std::vector<std::string> failed;
    int assetsDownloaded = 0;
    bool commitCreated = false;
    bool pushed = false;

    bool success() const { return failed.empty(); }
};

/**
 * @class SyncService
 * @brief Discovery, per-document render, index generation, commit and push.
 *
 * A failing document is recorded and the batch continues. A discovery failure
 * ends the pass with "(page discovery)" recorded as failed.
 */
class SyncService {
public:
    static constexpr const char* kContentFile = "README.md";
    static constexpr const char* kAssetDirName = "images";
    static constexpr const char* kDiscoveryFailure = "(page discovery)";
    static constexpr const char* kGitFailure = "(git)";

    SyncService(std::shared_ptr<domain::DocumentSource> source,
                std::shared_ptr<domain::VersionControl> vcs,
                std::shared_ptr<domain::SyncStateRepository> stateRepository,
                std::shared_ptr<infrastructure::PersistenceService> persistence,
                domain::SlugGenerator slugs,
                SyncOptions options);

    /** @throws SyncCancelled when the cancel flag is raised mid-pass. */
    SyncResult sync();

    /** @brief Prints the synced documents and the last overall sync time. */
    void printStatus(std::ostream& out) const;

    /** @brief Deletes every synced directory and the root index, then resets the state store. */
    void clean();

    /** @brief Directory for a document; falls back to "page-<id prefix>" when the title slugs to nothing. */
    std::string directoryFor(const domain::RemoteDocument& document) const;

private:
    bool syncDocument(const domain::RemoteDocument& document, domain::SyncState& state, SyncResult& result);
    void writeIndex(const std::vector<domain::RemoteDocument>& documents);
    void commitChanges(const std::vector<std::string>& syncedDirectories, bool isInitial, SyncResult& result);
    void printSummary(const SyncResult& result) const;

    std::shared_ptr<domain::DocumentSource> m_source;
    std::shared_ptr<domain::VersionControl> m_vcs;
    std::shared_ptr<domain::SyncStateRepository> m_stateRepository;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
    domain::SlugGenerator m_slugs;
    SyncOptions m_options;
};

} // namespace notesync::application
