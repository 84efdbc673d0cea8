/**
 * @file NotionClient.cpp
 * @brief Implementation of NotionClient.
 */

#include "infrastructure/NotionClient.hpp"
#include <httplib.h>
#include <iostream>
#include <thread>

namespace notesync::infrastructure {

using json = nlohmann::json;

namespace {

constexpr size_t kMaxCallsPerWindow = 3;
constexpr auto kRateWindow = std::chrono::seconds(1);
constexpr int kMaxRetries = 3;
constexpr int kDefaultRetryAfterSeconds = 1;
constexpr int kApiTimeoutSeconds = 60;
constexpr int kDownloadTimeoutSeconds = 30;

int ParseRetryAfter(const std::string& value) {
    try {
        int seconds = std::stoi(value);
        return seconds > 0 ? seconds : kDefaultRetryAfterSeconds;
    } catch (const std::exception&) {
        return kDefaultRetryAfterSeconds;
    }
}

// "https://host:port/path?q" -> {"https://host:port", "/path?q"}
std::pair<std::string, std::string> SplitUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return {"", ""};
    }
    auto pathStart = url.find('/', schemeEnd + 3);
    if (pathStart == std::string::npos) {
        return {url, "/"};
    }
    return {url.substr(0, pathStart), url.substr(pathStart)};
}

} // namespace

NotionClient::NotionClient(const std::string& token, const std::string& baseUrl)
    : m_token(token), m_baseUrl(baseUrl) {}

std::string NotionClient::FormatId(const std::string& id) {
    std::string clean;
    clean.reserve(id.size());
    for (char c : id) {
        if (c != '-') clean.push_back(c);
    }
    if (clean.size() != 32) {
        return id;
    }
    return clean.substr(0, 8) + "-" + clean.substr(8, 4) + "-" + clean.substr(12, 4) + "-" +
           clean.substr(16, 4) + "-" + clean.substr(20);
}

json NotionClient::listBlockChildren(const std::string& blockId, const std::optional<std::string>& startCursor) {
    std::string path = "/v1/blocks/" + FormatId(blockId) + "/children?page_size=" + std::to_string(kPageSize);
    if (startCursor && !startCursor->empty()) {
        path += "&start_cursor=" + *startCursor;
    }
    return get(path);
}

json NotionClient::retrievePage(const std::string& pageId) {
    return get("/v1/pages/" + FormatId(pageId));
}

void NotionClient::throttle() {
    auto now = std::chrono::steady_clock::now();
    while (!m_recentCalls.empty() && now - m_recentCalls.front() >= kRateWindow) {
        m_recentCalls.pop_front();
    }
    if (m_recentCalls.size() >= kMaxCallsPerWindow) {
        std::this_thread::sleep_until(m_recentCalls.front() + kRateWindow);
        m_recentCalls.pop_front();
    }
    m_recentCalls.push_back(std::chrono::steady_clock::now());
}

json NotionClient::get(const std::string& path) {
    httplib::Client cli(m_baseUrl);
    cli.set_read_timeout(kApiTimeoutSeconds);

    httplib::Headers headers = {
        {"Authorization", "Bearer " + m_token},
        {"Notion-Version", kApiVersion}
    };

    for (int attempt = 0;; ++attempt) {
        throttle();
        ++m_requestCount;

        auto res = cli.Get(path, headers);
        if (!res) {
            throw NotionApiError("Connection failed: " + httplib::to_string(res.error()));
        }

        if (res->status == 429 && attempt < kMaxRetries) {
            int waitSeconds = ParseRetryAfter(res->get_header_value("Retry-After"));
            std::cerr << "[NotionClient] Rate limited, retrying in " << waitSeconds << "s" << std::endl;
            std::this_thread::sleep_for(std::chrono::seconds(waitSeconds));
            continue;
        }

        if (res->status != 200) {
            std::string message = "HTTP " + std::to_string(res->status);
            try {
                auto body = json::parse(res->body);
                if (body.contains("message") && body["message"].is_string()) {
                    message += ": " + body["message"].get<std::string>();
                }
            } catch (const std::exception&) {
                // Non-JSON error body; the status alone is reported.
            }
            throw NotionApiError(message, res->status);
        }

        try {
            return json::parse(res->body);
        } catch (const std::exception& e) {
            throw NotionApiError(std::string("JSON Parse Error: ") + e.what(), res->status);
        }
    }
}

std::optional<std::string> NotionClient::download(const std::string& url) {
    auto [origin, target] = SplitUrl(url);
    if (origin.empty()) {
        std::cerr << "[NotionClient] Unsupported URL: " << url << std::endl;
        return std::nullopt;
    }

    httplib::Client cli(origin);
    cli.set_follow_location(true);
    cli.set_connection_timeout(kDownloadTimeoutSeconds);
    cli.set_read_timeout(kDownloadTimeoutSeconds);

    auto res = cli.Get(target);
    if (!res) {
        std::cerr << "[NotionClient] Download failed: " << httplib::to_string(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[NotionClient] Download HTTP Error " << res->status << ": " << url << std::endl;
        return std::nullopt;
    }
    return res->body;
}

} // namespace notesync::infrastructure
