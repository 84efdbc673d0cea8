/**
 * @file NoteSyncApp.hpp
 * @brief Command-line application for NoteSync.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "application/SyncService.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace notesync::app {

/**
 * @struct CommandLine
 * @brief Parsed `notesync [command] [flags]` invocation.
 */
struct CommandLine {
    std::string command = "sync";
    bool noPush = false;
    bool force = false;
    bool dryRun = false;
    bool debug = false;
    bool yes = false;
    std::vector<std::string> unknownFlags;

    /** @brief Flags may appear anywhere; the first non-flag argument is the command. */
    static CommandLine Parse(const std::vector<std::string>& args);
};

/**
 * @class NoteSyncApp
 * @brief Loads configuration, builds the object graph and runs one command.
 */
class NoteSyncApp {
public:
    static constexpr const char* kVersion = "1.0.0";
    static constexpr int kExitOk = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitInterrupted = 130;

    explicit NoteSyncApp(CommandLine commandLine);

    /**
     * @brief Runs the selected command.
     * @return Process exit code.
     */
    int Run();

    static void PrintUsage();

private:
    /**
     * @brief Loads the configuration and wires the collaborators.
     * @throws infrastructure::ConfigError
     */
    void Init();

    int RunSync();
    int RunStatus();
    int RunClean();

    CommandLine m_commandLine;
    infrastructure::SyncConfig m_config;
    std::unique_ptr<application::SyncService> m_syncService;
};

} // namespace notesync::app
