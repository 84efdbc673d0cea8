/**
 * @file VersionControl.hpp
 * @brief Interface to the version-control backend of the mirrored tree.
 */

#pragma once
#include <string>
#include <vector>

namespace notesync::domain {

/**
 * @class VersionControl
 * @brief Narrow view of the repository: status, staging, commit and push.
 */
class VersionControl {
public:
    virtual ~VersionControl() = default;

    virtual bool isRepository() = 0;
    virtual void initRepository() = 0;
    virtual void configureUser(const std::string& name, const std::string& email) = 0;
    virtual bool hasCommits() = 0;

    /** @brief Raw porcelain status lines ("XY path"), one per changed file. */
    virtual std::vector<std::string> detectStatus() = 0;

    virtual void stageAll() = 0;

    /**
     * @brief Commits the staged changes.
     * @return False when there was nothing to commit or the commit failed.
     */
    virtual bool commit(const std::string& message) = 0;

    /** @return False when the remote is missing or the push failed. */
    virtual bool push(const std::string& remote, const std::string& branch) = 0;
};

} // namespace notesync::domain
