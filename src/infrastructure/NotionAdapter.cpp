/**
 * @file NotionAdapter.cpp
 * @brief Implementation of the NotionAdapter class.
 */
#include "infrastructure/NotionAdapter.hpp"
#include <iostream>

using json = nlohmann::json;

namespace notesync::infrastructure {

namespace {

std::string StripDashes(const std::string& id) {
    std::string out;
    out.reserve(id.size());
    for (char c : id) {
        if (c != '-') out.push_back(c);
    }
    return out;
}

std::string StringAt(const json& object, const char* key) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

bool BoolAt(const json& object, const char* key) {
    return object.is_object() && object.contains(key) && object[key].is_boolean() && object[key].get<bool>();
}

domain::TimePoint RequireTimestamp(const json& page, const char* key) {
    auto parsed = domain::Timestamp::Parse(StringAt(page, key));
    if (!parsed) {
        throw NotionApiError(std::string("Invalid or missing ") + key + " in page " + StringAt(page, "id"));
    }
    return *parsed;
}

std::string ExtractTitle(const json& page) {
    if (page.contains("properties") && page["properties"].is_object()) {
        const auto& props = page["properties"];
        if (props.contains("title") && props["title"].is_object()) {
            const auto& spans = props["title"].value("title", json::array());
            if (spans.is_array() && !spans.empty()) {
                std::string title = StringAt(spans[0], "plain_text");
                if (!title.empty()) return title;
            }
        }
    }
    if (page.contains("child_page")) {
        return StringAt(page["child_page"], "title");
    }
    return "";
}

// Icon and cover share the {type, <type>: {url}} shape.
std::optional<std::string> HostedUrl(const json& object, const char* type) {
    if (object.contains(type) && object[type].is_object()) {
        std::string url = StringAt(object[type], "url");
        if (!url.empty()) return url;
    }
    return std::nullopt;
}

} // namespace

NotionAdapter::NotionAdapter(std::shared_ptr<NotionClient> client)
    : m_client(std::move(client)) {}

domain::RemoteDocument NotionAdapter::ParsePage(const json& page) {
    domain::RemoteDocument doc;
    doc.id = StripDashes(StringAt(page, "id"));
    doc.title = ExtractTitle(page);
    doc.lastEditedTime = RequireTimestamp(page, "last_edited_time");
    doc.createdTime = RequireTimestamp(page, "created_time");
    doc.url = StringAt(page, "url");

    if (page.contains("icon") && page["icon"].is_object()) {
        const auto& icon = page["icon"];
        const std::string type = StringAt(icon, "type");
        if (type == "emoji") {
            std::string emoji = StringAt(icon, "emoji");
            if (!emoji.empty()) doc.icon = emoji;
        } else if (type == "external") {
            doc.icon = HostedUrl(icon, "external");
        }
    }

    if (page.contains("cover") && page["cover"].is_object()) {
        const auto& cover = page["cover"];
        const std::string type = StringAt(cover, "type");
        if (type == "external" || type == "file") {
            doc.cover = HostedUrl(cover, type.c_str());
        }
    }
    return doc;
}

domain::Block NotionAdapter::ParseBlock(const json& block) {
    const std::string type = StringAt(block, "type");
    json content = (block.contains(type) && block[type].is_object()) ? block[type] : json::object();

    domain::Block result = domain::Block::Make(StripDashes(StringAt(block, "id")), type, std::move(content));
    result.hasChildren = BoolAt(block, "has_children");
    return result;
}

std::vector<domain::RemoteDocument> NotionAdapter::listChildDocuments(const std::string& parentId) {
    std::vector<domain::RemoteDocument> documents;
    std::optional<std::string> cursor;

    do {
        json response = m_client->listBlockChildren(parentId, cursor);
        for (const auto& block : response.value("results", json::array())) {
            if (StringAt(block, "type") != "child_page") continue;

            json details = m_client->retrievePage(StringAt(block, "id"));
            if (block.contains("child_page")) {
                details["child_page"] = block["child_page"];
            }
            documents.push_back(ParsePage(details));
        }

        cursor.reset();
        if (BoolAt(response, "has_more")) {
            std::string next = StringAt(response, "next_cursor");
            if (!next.empty()) cursor = next;
        }
    } while (cursor);

    return documents;
}

std::vector<domain::Block> NotionAdapter::fetchBlockTree(const std::string& blockId) {
    std::vector<domain::Block> blocks;
    std::optional<std::string> cursor;

    do {
        json response = m_client->listBlockChildren(blockId, cursor);
        for (const auto& item : response.value("results", json::array())) {
            domain::Block block = ParseBlock(item);
            if (block.hasChildren) {
                block.children = fetchBlockTree(block.id);
            }
            blocks.push_back(std::move(block));
        }

        cursor.reset();
        if (BoolAt(response, "has_more")) {
            std::string next = StringAt(response, "next_cursor");
            if (!next.empty()) cursor = next;
        }
    } while (cursor);

    return blocks;
}

std::optional<std::string> NotionAdapter::fetchBinary(const std::string& url) {
    return m_client->download(url);
}

int NotionAdapter::requestCount() const {
    return m_client->requestCount();
}

} // namespace notesync::infrastructure
