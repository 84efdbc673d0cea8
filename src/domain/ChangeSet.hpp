/**
 * @file ChangeSet.hpp
 * @brief Typed filesystem deltas detected after a sync pass.
 */

#pragma once
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace notesync::domain {

enum class ChangeKind {
    Added,
    Modified,
    Deleted,
    Renamed
};

std::string ChangeKindToString(ChangeKind kind);

/**
 * @struct ChangeRecord
 * @brief One changed path in the mirrored tree.
 */
struct ChangeRecord {
    std::string path;                     ///< Repository-relative, '/' separated.
    ChangeKind kind = ChangeKind::Modified;
    std::optional<std::string> priorPath; ///< Renames only.

    /**
     * @brief First path segment, or std::nullopt for root-level files and
     * hidden directories such as the internal state directory.
     *
     * linux/README.md -> "linux", README.md -> none, .notion-sync/state.json -> none
     */
    std::optional<std::string> group() const;

    /** @brief True for a single-segment, non-hidden path. */
    bool isRootFile() const;

    /** @brief Final path segment. */
    std::string filename() const;

    /** @brief True when the extension is one of the tracked image types. */
    bool isImage() const;
};

/**
 * @class ChangeSet
 * @brief Ordered collection of ChangeRecords. All aggregates are computed on demand.
 */
class ChangeSet {
public:
    ChangeSet() = default;
    explicit ChangeSet(std::vector<ChangeRecord> records) : m_records(std::move(records)) {}

    void add(ChangeRecord record) { m_records.push_back(std::move(record)); }

    const std::vector<ChangeRecord>& records() const { return m_records; }
    bool hasChanges() const { return !m_records.empty(); }
    size_t size() const { return m_records.size(); }

    /** @brief Distinct non-absent groups, sorted. */
    std::set<std::string> groups() const;

    size_t countOf(ChangeKind kind) const;

    /** @brief Added files with an image extension. */
    size_t imagesAdded() const;

    bool hasRootChanges() const;

    /** @brief Records whose group equals the given one, in order. */
    std::vector<ChangeRecord> inGroup(const std::string& group) const;

private:
    std::vector<ChangeRecord> m_records;
};

} // namespace notesync::domain
