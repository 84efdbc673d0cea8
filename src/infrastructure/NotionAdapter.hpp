/**
 * @file NotionAdapter.hpp
 * @brief DocumentSource backed by the Notion REST API.
 */

#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include "domain/DocumentSource.hpp"
#include "infrastructure/NotionClient.hpp"

namespace notesync::infrastructure {

/**
 * @class NotionAdapter
 * @brief Implements DocumentSource on top of NotionClient.
 *
 * Follows pagination cursors and expands every block that reports children.
 * API failures propagate as NotionApiError.
 */
class NotionAdapter : public domain::DocumentSource {
public:
    explicit NotionAdapter(std::shared_ptr<NotionClient> client);

    /** @see domain::DocumentSource::listChildDocuments */
    std::vector<domain::RemoteDocument> listChildDocuments(const std::string& parentId) override;

    /** @see domain::DocumentSource::fetchBlockTree */
    std::vector<domain::Block> fetchBlockTree(const std::string& blockId) override;

    /** @see domain::DocumentSource::fetchBinary */
    std::optional<std::string> fetchBinary(const std::string& url) override;

    int requestCount() const override;

    /**
     * @brief Builds a RemoteDocument from a page object.
     * @param page Page object; may carry the originating `child_page` payload for the title fallback.
     * @throws NotionApiError when the timestamps are missing or malformed.
     */
    static domain::RemoteDocument ParsePage(const nlohmann::json& page);

    /** @brief Builds a childless Block from a block object. */
    static domain::Block ParseBlock(const nlohmann::json& block);

private:
    std::shared_ptr<NotionClient> m_client;
};

} // namespace notesync::infrastructure
