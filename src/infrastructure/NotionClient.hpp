/**
 * @file NotionClient.hpp
 * @brief Low-level HTTP client for the Notion REST API.
 */

#pragma once

#include <chrono>
#include <deque>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace notesync::infrastructure {

/**
 * @class NotionApiError
 * @brief Terminal failure of a Notion request (HTTP status, transport or parse).
 */
class NotionApiError : public std::runtime_error {
public:
    NotionApiError(const std::string& message, int status = 0)
        : std::runtime_error(message), m_status(status) {}

    /** @brief HTTP status, or 0 when the request never got a response. */
    int status() const { return m_status; }

private:
    int m_status;
};

class NotionClient {
public:
    static constexpr const char* kDefaultBaseUrl = "https://api.notion.com";
    static constexpr const char* kApiVersion = "2022-06-28";
    static constexpr int kPageSize = 100;

    explicit NotionClient(const std::string& token, const std::string& baseUrl = kDefaultBaseUrl);

    /** @brief GET /v1/blocks/{id}/children. Throws NotionApiError. */
    nlohmann::json listBlockChildren(const std::string& blockId,
                                     const std::optional<std::string>& startCursor = std::nullopt);

    /** @brief GET /v1/pages/{id}. Throws NotionApiError. */
    nlohmann::json retrievePage(const std::string& pageId);

    /** @brief Downloads an arbitrary http(s) URL, following redirects. */
    std::optional<std::string> download(const std::string& url);

    /** @brief Number of API requests issued (retries included). */
    int requestCount() const { return m_requestCount; }

    /** @brief Formats a 32-character id as a dashed UUID; other ids pass through. */
    static std::string FormatId(const std::string& id);

private:
    nlohmann::json get(const std::string& path);
    void throttle();

    std::string m_token;
    std::string m_baseUrl;
    int m_requestCount = 0;
    std::deque<std::chrono::steady_clock::time_point> m_recentCalls; ///< Sliding rate-limit window.
};

} // namespace notesync::infrastructure
