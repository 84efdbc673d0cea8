/**
 * @file ChangeClassifier.hpp
 * @brief Turns porcelain status lines into a typed ChangeSet.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/ChangeSet.hpp"

namespace notesync::domain {

/**
 * @brief Stateless parser for `git status --porcelain=v1` output.
 *
 * Classification depends only on the two status characters and the path text.
 * Malformed lines are skipped.
 */
class ChangeClassifier {
public:
    static ChangeSet Classify(const std::vector<std::string>& statusLines);

    /** @brief Parses one "XY path" or "XY old -> new" line. */
    static std::optional<ChangeRecord> ParseLine(const std::string& line);

    /** @brief Maps the index/worktree status pair to a change kind. */
    static ChangeKind KindFromStatus(char indexStatus, char worktreeStatus);
};

} // namespace notesync::domain
