/**
 * @file GitCliAdapter.hpp
 * @brief VersionControl implementation that drives the git command line.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/VersionControl.hpp"

namespace notesync::infrastructure {

/**
 * @class GitCliAdapter
 * @brief Runs `git -C <root> ...` through a shell pipe.
 *
 * In dry-run mode commit and push only report what they would do.
 */
class GitCliAdapter : public domain::VersionControl {
public:
    GitCliAdapter(const std::string& repoRoot, bool dryRun = false, bool debug = false);

    bool isRepository() override;
    /** @throws std::runtime_error when `git init` fails. */
    void initRepository() override;
    void configureUser(const std::string& name, const std::string& email) override;
    bool hasCommits() override;
    std::vector<std::string> detectStatus() override;
    /** @throws std::runtime_error when `git add -A` fails. */
    void stageAll() override;
    bool commit(const std::string& message) override;
    bool push(const std::string& remote, const std::string& branch) override;

    /** @brief Wraps an argument in single quotes for /bin/sh. */
    static std::string ShellQuote(const std::string& arg);

    /** @brief Splits command output into lines, keeping leading status columns intact. */
    static std::vector<std::string> SplitLines(const std::string& output);

private:
    struct CommandResult {
        int exitCode = -1;
        std::string output;
    };

    /** @param quiet Discards stderr, for probes whose failure is an expected answer. */
    CommandResult run(const std::vector<std::string>& args, bool quiet = false) const;

    std::string m_repoRoot;
    bool m_dryRun;
    bool m_debug;
};

} // namespace notesync::infrastructure
