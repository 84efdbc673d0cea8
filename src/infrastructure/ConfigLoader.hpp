/**
 * @file ConfigLoader.hpp
 * @brief Loads the sync configuration from the environment and settings.json.
 *
 * Environment variables may be seeded from a `.env` file; variables that are
 * already set always win. Title overrides come from `.notion-sync/settings.json`.
 */

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace notesync::infrastructure {

/**
 * @class ConfigError
 * @brief Missing or invalid configuration. Fatal for the run.
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct SyncConfig
 * @brief Everything a sync run needs to know about its environment.
 */
struct SyncConfig {
    std::string notionToken;
    std::string notionParentPageId;   ///< Without dashes.
    std::string gitUserName;
    std::string gitUserEmail;
    std::optional<std::string> githubToken;
    std::string repoRoot;

    bool debug = false;
    bool dryRun = false;
    bool forceSync = false;

    std::string gitRemote = "origin";
    std::string gitBranch = "main";

    /** Lowercased title -> directory, merged over the built-in slug table. */
    std::map<std::string, std::string> titleOverrides;

    std::string syncDir() const;
    std::string stateFile() const;
    std::string settingsFile() const;
};

class ConfigLoader {
public:
    /** @brief Variable lookup; std::nullopt when unset. */
    using Environment = std::function<std::optional<std::string>(const std::string& name)>;

    static constexpr const char* kSyncDirName = ".notion-sync";

    /**
     * @brief Builds the configuration from a variable lookup.
     * @throws ConfigError when a required variable is missing or empty.
     */
    static SyncConfig Load(const Environment& env);

    /**
     * @brief Seeds the process environment from `envFile` (if present), then
     * loads from the process environment and reads title overrides.
     * @throws ConfigError
     */
    static SyncConfig FromEnvironment(const std::string& envFile = ".env");

    /** @brief Parses KEY=VALUE lines. Supports comments, `export` and quoted values. */
    static std::map<std::string, std::string> ParseDotEnv(const std::string& content);

    /**
     * @brief Reads "title_overrides" from settings.json.
     * @return Empty map when the file is missing or unreadable.
     */
    static std::map<std::string, std::string> LoadTitleOverrides(const std::string& settingsFile);

    /** @brief "true" in any letter case. */
    static bool IsTrue(const std::optional<std::string>& value);
};

} // namespace notesync::infrastructure
