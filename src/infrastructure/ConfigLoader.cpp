/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace notesync::infrastructure {

namespace fs = std::filesystem;
using domain::TextUtils;

namespace {

std::string Require(const ConfigLoader::Environment& env, const std::string& name, const std::string& hint) {
    auto value = env(name);
    if (!value || value->empty()) {
        throw ConfigError(name + " environment variable is required.\n" + hint);
    }
    return *value;
}

std::optional<std::string> ProcessVariable(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

void SetIfUnset(const std::string& name, const std::string& value) {
#if defined(_WIN32)
    if (!std::getenv(name.c_str())) {
        _putenv_s(name.c_str(), value.c_str());
    }
#else
    setenv(name.c_str(), value.c_str(), 0);
#endif
}

} // namespace

std::string SyncConfig::syncDir() const {
    return (fs::path(repoRoot) / ConfigLoader::kSyncDirName).string();
}

std::string SyncConfig::stateFile() const {
    return (fs::path(syncDir()) / "state.json").string();
}

std::string SyncConfig::settingsFile() const {
    return (fs::path(syncDir()) / "settings.json").string();
}

bool ConfigLoader::IsTrue(const std::optional<std::string>& value) {
    return value && TextUtils::ToLower(TextUtils::Trim(*value)) == "true";
}

SyncConfig ConfigLoader::Load(const Environment& env) {
    SyncConfig config;
    config.notionToken = Require(env, "NOTION_TOKEN",
        "Create a Notion integration at https://www.notion.so/my-integrations");

    std::string parentId = Require(env, "NOTION_PARENT_PAGE_ID",
        "This should be the ID of the parent page in Notion.");
    parentId.erase(std::remove(parentId.begin(), parentId.end(), '-'), parentId.end());
    config.notionParentPageId = parentId;

    config.gitUserName = Require(env, "GIT_USER_NAME", "Set this to your name for git commits.");
    config.gitUserEmail = Require(env, "GIT_USER_EMAIL", "Set this to your email for git commits.");

    auto githubToken = env("GITHUB_TOKEN");
    if (githubToken && !githubToken->empty()) {
        config.githubToken = githubToken;
    }

    auto repoRoot = env("REPO_ROOT");
    config.repoRoot = (repoRoot && !repoRoot->empty()) ? *repoRoot : fs::current_path().string();

    config.debug = IsTrue(env("DEBUG"));
    config.dryRun = IsTrue(env("DRY_RUN"));
    config.forceSync = IsTrue(env("FORCE_SYNC"));

    if (auto remote = env("GIT_REMOTE"); remote && !remote->empty()) {
        config.gitRemote = *remote;
    }
    if (auto branch = env("GIT_BRANCH"); branch && !branch->empty()) {
        config.gitBranch = *branch;
    }
    return config;
}

std::map<std::string, std::string> ConfigLoader::ParseDotEnv(const std::string& content) {
    std::map<std::string, std::string> values;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        line = TextUtils::Trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) {
            line = TextUtils::Trim(line.substr(7));
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = TextUtils::Trim(line.substr(0, eq));
        std::string value = TextUtils::Trim(line.substr(eq + 1));
        if (key.empty()) continue;

        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            // Unquoted values may carry a trailing comment.
            size_t hash = value.find(" #");
            if (hash != std::string::npos) {
                value = TextUtils::Trim(value.substr(0, hash));
            }
        }
        values[key] = value;
    }
    return values;
}

std::map<std::string, std::string> ConfigLoader::LoadTitleOverrides(const std::string& settingsFile) {
    std::map<std::string, std::string> overrides;
    if (!fs::exists(settingsFile)) {
        return overrides;
    }

    try {
        std::ifstream f(settingsFile);
        nlohmann::json j;
        f >> j;

        if (j.contains("title_overrides") && j["title_overrides"].is_object()) {
            for (auto it = j["title_overrides"].begin(); it != j["title_overrides"].end(); ++it) {
                if (it.value().is_string()) {
                    overrides[TextUtils::ToLower(it.key())] = it.value().get<std::string>();
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }
    return overrides;
}

SyncConfig ConfigLoader::FromEnvironment(const std::string& envFile) {
    if (!envFile.empty() && fs::exists(envFile)) {
        std::ifstream in(envFile);
        std::stringstream buffer;
        buffer << in.rdbuf();
        for (const auto& [key, value] : ParseDotEnv(buffer.str())) {
            SetIfUnset(key, value);
        }
    }

    SyncConfig config = Load(ProcessVariable);
    config.titleOverrides = LoadTitleOverrides(config.settingsFile());
    return config;
}

} // namespace notesync::infrastructure
