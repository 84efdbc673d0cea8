/**
 * @file DocumentSource.hpp
 * @brief Interface to the remote document service (pages, block trees, binaries).
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include "domain/Block.hpp"
#include "domain/RemoteDocument.hpp"

namespace notesync::domain {

/**
 * @class DocumentSource
 * @brief Abstract read-only view of the remote workspace.
 *
 * Implementations own authentication, pagination, rate limiting and retries.
 * Terminal failures are reported by throwing; the caller decides whether the
 * failure aborts the run or just the current document.
 */
class DocumentSource {
public:
    virtual ~DocumentSource() = default;

    /**
     * @brief Lists the child pages of a parent page, in remote order.
     * @param parentId Parent page id, with or without dashes.
     */
    virtual std::vector<RemoteDocument> listChildDocuments(const std::string& parentId) = 0;

    /**
     * @brief Fetches the blocks of a page or block, expanding every block
     * that reports children into a full tree.
     */
    virtual std::vector<Block> fetchBlockTree(const std::string& blockId) = 0;

    /**
     * @brief Downloads the bytes behind a URL.
     * @return std::nullopt on any transport or HTTP error.
     */
    virtual std::optional<std::string> fetchBinary(const std::string& url) = 0;

    /** @brief Number of API requests issued so far. */
    virtual int requestCount() const { return 0; }
};

} // namespace notesync::domain
