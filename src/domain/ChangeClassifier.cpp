/**
 * @file ChangeClassifier.cpp
 * @brief Implementation of ChangeClassifier.
 */

#include "domain/ChangeClassifier.hpp"
#include "domain/TextUtils.hpp"

namespace notesync::domain {

namespace {

const std::string kRenameArrow = " -> ";

// git wraps paths with unusual characters in C-style quotes.
std::string Unquote(const std::string& raw) {
    if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') return raw;

    const std::string body = raw.substr(1, raw.size() - 2);
    std::string out;
    size_t i = 0;
    while (i < body.size()) {
        char c = body[i++];
        if (c != '\\' || i >= body.size()) {
            out += c;
            continue;
        }
        char next = body[i++];
        if (next == 'n') {
            out += '\n';
        } else if (next == 't') {
            out += '\t';
        } else if (next >= '0' && next <= '7') {
            // Octal byte escape, up to three digits.
            int value = next - '0';
            for (int digits = 1; digits < 3 && i < body.size() && body[i] >= '0' && body[i] <= '7'; ++digits) {
                value = value * 8 + (body[i++] - '0');
            }
            out += static_cast<char>(value);
        } else {
            out += next;
        }
    }
    return out;
}

} // namespace

ChangeKind ChangeClassifier::KindFromStatus(char indexStatus, char worktreeStatus) {
    if (indexStatus == '?' || worktreeStatus == '?') return ChangeKind::Added;
    if (indexStatus == 'D' || worktreeStatus == 'D') return ChangeKind::Deleted;
    if (indexStatus == 'A') return ChangeKind::Added;
    if (indexStatus == 'R' || worktreeStatus == 'R') return ChangeKind::Renamed;
    return ChangeKind::Modified;
}

std::optional<ChangeRecord> ChangeClassifier::ParseLine(const std::string& line) {
    // XY<space>PATH, so at least four characters.
    if (line.size() < 4) return std::nullopt;

    std::string payload;
    if (line[2] == ' ') {
        payload = line.substr(3);
    } else {
        size_t space = line.find(' ', 2);
        if (space == std::string::npos) return std::nullopt;
        payload = line.substr(space + 1);
    }
    if (TextUtils::Trim(payload).empty()) return std::nullopt;

    ChangeRecord record;
    size_t arrow = payload.find(kRenameArrow);
    if (arrow != std::string::npos) {
        std::string oldPath = Unquote(TextUtils::Trim(payload.substr(0, arrow)));
        std::string newPath = Unquote(TextUtils::Trim(payload.substr(arrow + kRenameArrow.size())));
        if (newPath.empty()) return std::nullopt;
        record.path = newPath;
        record.kind = ChangeKind::Renamed;
        record.priorPath = oldPath;
        return record;
    }

    record.path = Unquote(TextUtils::Trim(payload));
    record.kind = KindFromStatus(line[0], line[1]);
    return record;
}

ChangeSet ChangeClassifier::Classify(const std::vector<std::string>& statusLines) {
    ChangeSet changes;
    for (const auto& line : statusLines) {
        if (line.empty()) continue;
        if (auto record = ParseLine(line)) {
            changes.add(std::move(*record));
        }
    }
    return changes;
}

} // namespace notesync::domain
