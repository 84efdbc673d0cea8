/**
 * @file ChangeSet.cpp
 * @brief Implementation of ChangeRecord and ChangeSet aggregates.
 */

#include "domain/ChangeSet.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace notesync::domain {

namespace {

constexpr std::array<const char*, 6> kImageExtensions = {".png", ".jpg", ".jpeg", ".gif", ".webp", ".svg"};

std::vector<std::string> SplitSegments(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) parts.push_back(current);
    return parts;
}

} // namespace

std::string ChangeKindToString(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::Added: return "added";
        case ChangeKind::Modified: return "modified";
        case ChangeKind::Deleted: return "deleted";
        case ChangeKind::Renamed: return "renamed";
    }
    return "modified";
}

std::optional<std::string> ChangeRecord::group() const {
    auto parts = SplitSegments(path);
    if (parts.size() < 2) return std::nullopt;
    if (parts.front().front() == '.') return std::nullopt;
    return parts.front();
}

bool ChangeRecord::isRootFile() const {
    auto parts = SplitSegments(path);
    return parts.size() == 1 && parts.front().front() != '.';
}

std::string ChangeRecord::filename() const {
    auto parts = SplitSegments(path);
    return parts.empty() ? std::string() : parts.back();
}

bool ChangeRecord::isImage() const {
    std::string name = filename();
    size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) return false;
    const std::string ext = TextUtils::ToLower(name.substr(dot));
    return std::find(kImageExtensions.begin(), kImageExtensions.end(), ext) != kImageExtensions.end();
}

std::set<std::string> ChangeSet::groups() const {
    std::set<std::string> result;
    for (const auto& record : m_records) {
        if (auto g = record.group()) {
            result.insert(*g);
        }
    }
    return result;
}

size_t ChangeSet::countOf(ChangeKind kind) const {
    return static_cast<size_t>(std::count_if(m_records.begin(), m_records.end(),
        [kind](const ChangeRecord& r) { return r.kind == kind; }));
}

size_t ChangeSet::imagesAdded() const {
    return static_cast<size_t>(std::count_if(m_records.begin(), m_records.end(),
        [](const ChangeRecord& r) { return r.kind == ChangeKind::Added && r.isImage(); }));
}

bool ChangeSet::hasRootChanges() const {
    return std::any_of(m_records.begin(), m_records.end(),
        [](const ChangeRecord& r) { return r.isRootFile(); });
}

std::vector<ChangeRecord> ChangeSet::inGroup(const std::string& group) const {
    std::vector<ChangeRecord> result;
    for (const auto& record : m_records) {
        auto g = record.group();
        if (g && *g == group) result.push_back(record);
    }
    return result;
}

} // namespace notesync::domain
