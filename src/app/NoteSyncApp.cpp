/**
 * @file NoteSyncApp.cpp
 * @brief Implementation of the NoteSyncApp class.
 */

#include "app/NoteSyncApp.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

#include "domain/SlugGenerator.hpp"
#include "infrastructure/GitCliAdapter.hpp"
#include "infrastructure/JsonSyncStateRepository.hpp"
#include "infrastructure/NotionAdapter.hpp"
#include "infrastructure/NotionClient.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace notesync::app {

namespace {

std::atomic<bool> g_cancelRequested{false};

void HandleInterrupt(int) {
    g_cancelRequested.store(true);
}

} // namespace

CommandLine CommandLine::Parse(const std::vector<std::string>& args) {
    CommandLine cl;
    bool commandSeen = false;
    for (const auto& arg : args) {
        if (arg == "--no-push") {
            cl.noPush = true;
        } else if (arg == "--force") {
            cl.force = true;
        } else if (arg == "--dry-run") {
            cl.dryRun = true;
        } else if (arg == "--debug") {
            cl.debug = true;
        } else if (arg == "--yes") {
            cl.yes = true;
        } else if (arg.rfind("--", 0) == 0) {
            cl.unknownFlags.push_back(arg);
        } else if (!commandSeen) {
            cl.command = arg;
            commandSeen = true;
        }
    }
    return cl;
}

NoteSyncApp::NoteSyncApp(CommandLine commandLine)
    : m_commandLine(std::move(commandLine)) {}

void NoteSyncApp::PrintUsage() {
    std::cout << "Usage: notesync [sync|status|clean|version] [--no-push] [--force] [--dry-run] [--debug] [--yes]\n"
              << "\n"
              << "  sync      Mirror the Notion pages into the repository (default)\n"
              << "  status    Show the synced pages and the last sync time\n"
              << "  clean     Remove all synced content and reset the state\n"
              << "  version   Show version information\n";
}

void NoteSyncApp::Init() {
    m_config = infrastructure::ConfigLoader::FromEnvironment();

    // Command-line flags override the environment.
    if (m_commandLine.force) m_config.forceSync = true;
    if (m_commandLine.dryRun) m_config.dryRun = true;
    if (m_commandLine.debug) m_config.debug = true;

    // Composition root
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto client = std::make_shared<infrastructure::NotionClient>(m_config.notionToken);
    auto source = std::make_shared<infrastructure::NotionAdapter>(client);
    auto vcs = std::make_shared<infrastructure::GitCliAdapter>(m_config.repoRoot, m_config.dryRun, m_config.debug);
    auto stateRepository = std::make_shared<infrastructure::JsonSyncStateRepository>(m_config.stateFile(), persistence);

    application::SyncOptions options;
    options.repoRoot = m_config.repoRoot;
    options.parentPageId = m_config.notionParentPageId;
    options.gitUserName = m_config.gitUserName;
    options.gitUserEmail = m_config.gitUserEmail;
    options.gitRemote = m_config.gitRemote;
    options.gitBranch = m_config.gitBranch;
    options.force = m_config.forceSync;
    options.push = !m_commandLine.noPush;
    options.cancelFlag = &g_cancelRequested;

    m_syncService = std::make_unique<application::SyncService>(
        source, vcs, stateRepository, persistence,
        domain::SlugGenerator(m_config.titleOverrides), options);

    if (m_config.debug) {
        std::cout << "[NoteSyncApp] Repository root: " << m_config.repoRoot << std::endl;
        std::cout << "[NoteSyncApp] State file: " << m_config.stateFile() << std::endl;
    }
}

int NoteSyncApp::Run() {
    for (const auto& flag : m_commandLine.unknownFlags) {
        std::cerr << "[NoteSyncApp] Ignoring unknown option " << flag << std::endl;
    }

    const std::string& command = m_commandLine.command;
    if (command == "version") {
        std::cout << "NoteSync v" << kVersion << std::endl;
        return kExitOk;
    }
    if (command == "help") {
        PrintUsage();
        return kExitOk;
    }
    if (command != "sync" && command != "status" && command != "clean") {
        std::cerr << "Unknown command: " << command << "\n";
        PrintUsage();
        return kExitFailure;
    }

    try {
        Init();
    } catch (const infrastructure::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return kExitFailure;
    }

    try {
        if (command == "status") return RunStatus();
        if (command == "clean") return RunClean();
        return RunSync();
    } catch (const application::SyncCancelled&) {
        std::cerr << "\nSync cancelled." << std::endl;
        return kExitInterrupted;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    }
}

int NoteSyncApp::RunSync() {
    std::signal(SIGINT, HandleInterrupt);
    application::SyncResult result = m_syncService->sync();
    std::signal(SIGINT, SIG_DFL);
    return result.success() ? kExitOk : kExitFailure;
}

int NoteSyncApp::RunStatus() {
    m_syncService->printStatus(std::cout);
    return kExitOk;
}

int NoteSyncApp::RunClean() {
    if (!m_commandLine.yes) {
        std::cout << "This will delete all synced content and reset state." << std::endl;
        std::cout << "Are you sure? (yes/no): " << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer) || (answer != "yes" && answer != "YES" && answer != "Yes")) {
            std::cout << "Aborted." << std::endl;
            return kExitOk;
        }
    }
    m_syncService->clean();
    return kExitOk;
}

} // namespace notesync::app
