/**
 * @file ExportService.hpp
 * @brief Composes the files written into the mirrored tree.
 */

#pragma once

#include <functional>
#include <string>
#include <vector>
#include "domain/RemoteDocument.hpp"

namespace notesync::application {

class ExportService {
public:
    /** @brief Directory (relative to the repository root) a document is written to. */
    using DirectoryResolver = std::function<std::string(const domain::RemoteDocument&)>;

    /**
     * @brief Wraps a rendered body with the document title and a metadata header.
     */
    static std::string ComposeDocument(const domain::RemoteDocument& document, const std::string& body);

    /**
     * @brief Builds the root index listing every document alphabetically by title.
     * @param directoryFor Must resolve the same directory the document was written to.
     */
    static std::string ComposeIndex(const std::vector<domain::RemoteDocument>& documents,
                                    const DirectoryResolver& directoryFor,
                                    domain::TimePoint generatedAt);

    static constexpr const char* kDefaultIcon = "📄";
};

} // namespace notesync::application
