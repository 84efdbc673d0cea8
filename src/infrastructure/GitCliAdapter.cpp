/**
 * @file GitCliAdapter.cpp
 * @brief Implementation of GitCliAdapter.
 */

#include "infrastructure/GitCliAdapter.hpp"
#include <cstdio>
#include <iostream>
#include <sstream>
#include <stdexcept>
#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace notesync::infrastructure {

namespace {

int DecodeExitStatus(int status) {
#if defined(_WIN32)
    return status;
#else
    if (status == -1) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
#endif
}

std::string FirstLine(const std::string& text) {
    return text.substr(0, text.find('\n'));
}

} // namespace

GitCliAdapter::GitCliAdapter(const std::string& repoRoot, bool dryRun, bool debug)
    : m_repoRoot(repoRoot), m_dryRun(dryRun), m_debug(debug) {}

std::string GitCliAdapter::ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::vector<std::string> GitCliAdapter::SplitLines(const std::string& output) {
    std::vector<std::string> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

GitCliAdapter::CommandResult GitCliAdapter::run(const std::vector<std::string>& args, bool quiet) const {
    std::string cmd = "git -C " + ShellQuote(m_repoRoot);
    for (const auto& arg : args) {
        cmd += " " + ShellQuote(arg);
    }
    if (quiet) {
        cmd += " 2>/dev/null";
    }

    if (m_debug) {
        std::cout << "[GitCli] Running: " << cmd << std::endl;
    }

    CommandResult result;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        std::cerr << "[GitCli] popen failed to start command." << std::endl;
        return result;
    }
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result.output.append(buffer);
    }
    result.exitCode = DecodeExitStatus(pclose(pipe));
    return result;
}

bool GitCliAdapter::isRepository() {
    return run({"rev-parse", "--git-dir"}, true).exitCode == 0;
}

void GitCliAdapter::initRepository() {
    if (isRepository()) return;
    if (run({"init"}).exitCode != 0) {
        throw std::runtime_error("git init failed in " + m_repoRoot);
    }
    std::cout << "[GitCli] Initialized new git repository" << std::endl;
}

void GitCliAdapter::configureUser(const std::string& name, const std::string& email) {
    if (run({"config", "user.name", name}).exitCode != 0 ||
        run({"config", "user.email", email}).exitCode != 0) {
        std::cerr << "[GitCli] Warning: Could not configure git user" << std::endl;
    }
}

bool GitCliAdapter::hasCommits() {
    return run({"rev-parse", "--verify", "--quiet", "HEAD"}, true).exitCode == 0;
}

std::vector<std::string> GitCliAdapter::detectStatus() {
    auto result = run({"status", "--porcelain=v1", "-uall"});
    if (result.exitCode != 0) {
        std::cerr << "[GitCli] Warning: git status failed with code " << result.exitCode << std::endl;
        return {};
    }
    return SplitLines(result.output);
}

void GitCliAdapter::stageAll() {
    if (run({"add", "-A"}).exitCode != 0) {
        throw std::runtime_error("git add failed");
    }
}

bool GitCliAdapter::commit(const std::string& message) {
    if (m_dryRun) {
        std::cout << "[GitCli] Dry run - would commit:\n" << message << std::endl;
        return true;
    }

    if (run({"diff", "--cached", "--quiet"}).exitCode == 0) {
        std::cout << "[GitCli] No changes to commit" << std::endl;
        return false;
    }

    auto result = run({"commit", "-m", message});
    if (result.exitCode != 0) {
        std::cerr << "[GitCli] Commit failed with code " << result.exitCode << std::endl;
        return false;
    }
    std::cout << "[GitCli] Committed: " << FirstLine(message) << std::endl;
    return true;
}

bool GitCliAdapter::push(const std::string& remote, const std::string& branch) {
    if (m_dryRun) {
        std::cout << "[GitCli] Dry run - would push to " << remote << "/" << branch << std::endl;
        return true;
    }

    if (run({"remote", "get-url", remote}, true).exitCode != 0) {
        std::cerr << "[GitCli] Remote '" << remote << "' not configured, skipping push" << std::endl;
        return false;
    }

    auto result = run({"push", remote, branch});
    if (result.exitCode != 0) {
        std::cerr << "[GitCli] Push failed with code " << result.exitCode << std::endl;
        return false;
    }
    std::cout << "[GitCli] Pushed to " << remote << "/" << branch << std::endl;
    return true;
}

} // namespace notesync::infrastructure
