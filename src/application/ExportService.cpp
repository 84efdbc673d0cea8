/**
 * @file ExportService.cpp
 * @brief Implementation of ExportService.
 */

#include "application/ExportService.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <sstream>

namespace notesync::application {

using domain::TextUtils;

std::string ExportService::ComposeDocument(const domain::RemoteDocument& document, const std::string& body) {
    std::stringstream ss;
    if (document.icon && !document.icon->empty()) {
        ss << "# " << *document.icon << " " << document.title << "\n";
    } else {
        ss << "# " << document.title << "\n";
    }
    ss << "\n";
    ss << "> 📅 Last updated: " << domain::Timestamp::ToDisplay(document.lastEditedTime) << " UTC\n";
    ss << "> 🔗 [View in Notion](" << document.url << ")\n";
    ss << "\n";
    ss << "---\n";
    ss << "\n";
    ss << body;
    return ss.str();
}

std::string ExportService::ComposeIndex(const std::vector<domain::RemoteDocument>& documents,
                                        const DirectoryResolver& directoryFor,
                                        domain::TimePoint generatedAt) {
    std::vector<domain::RemoteDocument> sorted = documents;
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return TextUtils::ToLower(a.title) < TextUtils::ToLower(b.title);
    });

    std::stringstream ss;
    ss << "# 📚 Tech Notes\n\n";
    ss << "A collection of technical notes and documentation.\n\n";
    ss << "---\n\n";
    ss << "## Topics\n\n";

    for (const auto& document : sorted) {
        const std::string icon = (document.icon && !document.icon->empty()) ? *document.icon : kDefaultIcon;
        ss << "- [" << icon << " " << document.title << "](./" << directoryFor(document) << "/)\n";
    }

    ss << "\n---\n\n";
    ss << "## About\n\n";
    ss << "These notes are automatically synced from [Notion](https://notion.so) using a custom sync system.\n\n";
    ss << "*Last sync: " << domain::Timestamp::ToDisplay(generatedAt) << " UTC*\n";
    return ss.str();
}

} // namespace notesync::application
