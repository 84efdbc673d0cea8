/**
 * @file MarkdownRenderer.cpp
 * @brief Implementation of MarkdownRenderer.
 */

#include "application/MarkdownRenderer.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <unordered_map>

namespace notesync::application {

using json = nlohmann::json;
using domain::Block;
using domain::BlockType;
using domain::TextUtils;

namespace {

const json& Field(const json& obj, const char* key) {
    static const json kNull;
    if (obj.is_object()) {
        auto it = obj.find(key);
        if (it != obj.end()) return *it;
    }
    return kNull;
}

std::string StringField(const json& obj, const char* key, const std::string& fallback = "") {
    const json& value = Field(obj, key);
    return value.is_string() ? value.get<std::string>() : fallback;
}

bool BoolField(const json& obj, const char* key) {
    const json& value = Field(obj, key);
    return value.is_boolean() && value.get<bool>();
}

std::string PrefixLines(const std::string& text, const std::string& prefix) {
    auto lines = TextUtils::SplitLines(text);
    for (auto& line : lines) line = prefix + line;
    return TextUtils::Join(lines, "\n");
}

// Media payloads carry their URL under "external" or "file" depending on "type".
std::string MediaUrl(const json& content) {
    const std::string type = StringField(content, "type");
    if (type == "external") return StringField(Field(content, "external"), "url");
    if (type == "file") return StringField(Field(content, "file"), "url");
    return "";
}

std::string CaptionLine(const std::string& caption) {
    return caption.empty() ? std::string() : "\n*" + caption + "*";
}

std::string UrlHost(const std::string& url) {
    auto schemeEnd = url.find("://");
    size_t start = schemeEnd == std::string::npos ? 0 : schemeEnd + 3;
    size_t end = url.find_first_of("/:?#", start);
    return TextUtils::ToLower(url.substr(start, end == std::string::npos ? std::string::npos : end - start));
}

bool IsStreamingHost(const std::string& url) {
    static const std::vector<std::string> kDomains = {"youtube.com", "youtu.be", "vimeo.com"};
    const std::string host = UrlHost(url);
    for (const auto& domain : kDomains) {
        if (host == domain) return true;
        if (host.size() > domain.size() &&
            host.compare(host.size() - domain.size(), domain.size(), domain) == 0 &&
            host[host.size() - domain.size() - 1] == '.') {
            return true;
        }
    }
    return false;
}

} // namespace

MarkdownRenderer::MarkdownRenderer(AssetResolveFn resolver)
    : m_resolver(std::move(resolver)) {}

RenderResult MarkdownRenderer::render(const std::vector<Block>& blocks,
                                      const std::string& assetDir,
                                      const std::string& relativeAssetPrefix) const {
    RenderContext ctx;
    ctx.assetDir = assetDir;
    ctx.relativeAssetPrefix = relativeAssetPrefix;

    std::vector<std::string> lines;
    std::optional<BlockType> previous;

    for (const auto& block : blocks) {
        if (previous && NeedsSpacing(*previous, block.type)) {
            lines.emplace_back();
        }
        if (block.type != BlockType::NumberedListItem) {
            ctx.numberedCounter = 0;
        }

        if (auto fragment = renderBlock(block, ctx)) {
            lines.push_back(std::move(*fragment));
        }
        previous = block.type;
    }

    RenderResult result;
    result.text = NormalizeWhitespace(TextUtils::Join(lines, "\n"));
    result.assets = std::move(ctx.assets);
    return result;
}

std::optional<std::string> MarkdownRenderer::renderBlock(const Block& block, RenderContext& ctx) const {
    switch (block.type) {
        case BlockType::Paragraph: return renderText(block, ctx, "");
        case BlockType::Heading1: return renderHeading(block, 1);
        case BlockType::Heading2: return renderHeading(block, 2);
        case BlockType::Heading3: return renderHeading(block, 3);
        case BlockType::BulletedListItem: return renderText(block, ctx, "- ");
        case BlockType::NumberedListItem: return renderNumbered(block, ctx);
        case BlockType::ToDo: return renderToDo(block, ctx);
        case BlockType::Toggle: return renderToggle(block, ctx);
        case BlockType::Code: return renderCode(block);
        case BlockType::Quote: return renderQuote(block, ctx);
        case BlockType::Callout: return renderCallout(block, ctx);
        case BlockType::Divider: return std::string("---");
        case BlockType::Image: return renderImage(block, ctx);
        case BlockType::Video: return renderVideo(block);
        case BlockType::File: return renderFile(block);
        case BlockType::Audio: return renderAudio(block);
        case BlockType::Pdf: return renderPdf(block);
        case BlockType::Embed: return renderEmbed(block);
        case BlockType::Bookmark: return renderBookmark(block);
        case BlockType::LinkPreview: return renderLinkPreview(block);
        case BlockType::Table: return renderTable(block);
        case BlockType::TableRow: return std::nullopt;
        case BlockType::ColumnList: return renderColumnList(block, ctx);
        case BlockType::Column: return std::nullopt;
        case BlockType::ChildPage: {
            std::string title = StringField(block.content, "title");
            return "📄 **" + (title.empty() ? std::string("Untitled") : title) + "** (subpage)";
        }
        case BlockType::ChildDatabase: {
            std::string title = StringField(block.content, "title");
            return "🗃️ **" + (title.empty() ? std::string("Untitled Database") : title) + "** (database)";
        }
        case BlockType::SyncedBlock: return renderSyncedBlock(block, ctx);
        case BlockType::Template:
            return "📋 Template: " + RichTextToMarkdown(Field(block.content, "rich_text"));
        case BlockType::Equation:
            return "$$\n" + StringField(block.content, "expression") + "\n$$";
        case BlockType::Breadcrumb: return std::nullopt;
        case BlockType::TableOfContents:
            return std::string("<!-- Table of Contents (auto-generated in Notion) -->");
        case BlockType::Unknown:
            return "<!-- Unsupported block type: " + (block.typeName.empty() ? std::string("unknown") : block.typeName) + " -->";
    }
    return std::nullopt;
}

std::string MarkdownRenderer::renderChildren(const std::vector<Block>& children, RenderContext& ctx, bool indent) const {
    if (children.empty()) return "";

    const int savedIndent = ctx.indentLevel;
    const int savedCounter = ctx.numberedCounter;
    if (indent) ctx.indentLevel += 1;
    ctx.numberedCounter = 0;

    std::vector<std::string> lines;
    for (const auto& child : children) {
        if (child.type != BlockType::NumberedListItem) {
            ctx.numberedCounter = 0;
        }
        auto fragment = renderBlock(child, ctx);
        if (!fragment) continue;
        // Two spaces per level; nested scopes have already indented their own lines.
        lines.push_back(indent ? PrefixLines(*fragment, "  ") : *fragment);
    }

    ctx.indentLevel = savedIndent;
    ctx.numberedCounter = savedCounter;
    return TextUtils::Join(lines, "\n");
}

std::string MarkdownRenderer::renderText(const Block& block, RenderContext& ctx, const std::string& prefix) const {
    std::string result = prefix + RichTextToMarkdown(Field(block.content, "rich_text"));
    std::string children = renderChildren(block.children, ctx, true);
    if (!children.empty()) {
        result += "\n" + children;
    }
    return result;
}

std::string MarkdownRenderer::renderHeading(const Block& block, int level) const {
    return std::string(static_cast<size_t>(level), '#') + " " + RichTextToMarkdown(Field(block.content, "rich_text"));
}

std::string MarkdownRenderer::renderNumbered(const Block& block, RenderContext& ctx) const {
    ctx.numberedCounter += 1;
    return renderText(block, ctx, std::to_string(ctx.numberedCounter) + ". ");
}

std::string MarkdownRenderer::renderToDo(const Block& block, RenderContext& ctx) const {
    const bool checked = BoolField(block.content, "checked");
    return renderText(block, ctx, checked ? "- [x] " : "- [ ] ");
}

std::string MarkdownRenderer::renderToggle(const Block& block, RenderContext& ctx) const {
    std::string result = "<details>\n<summary>" + RichTextToMarkdown(Field(block.content, "rich_text")) + "</summary>\n";
    std::string children = renderChildren(block.children, ctx, false);
    if (!children.empty()) {
        result += "\n" + children + "\n";
    }
    result += "</details>";
    return result;
}

std::string MarkdownRenderer::renderCode(const Block& block) const {
    const std::string code = RichTextToMarkdown(Field(block.content, "rich_text"));
    const std::string lang = MapCodeLanguage(StringField(block.content, "language"));
    const std::string caption = RichTextToMarkdown(Field(block.content, "caption"));
    return "```" + lang + "\n" + code + "\n```" + CaptionLine(caption);
}

std::string MarkdownRenderer::renderQuote(const Block& block, RenderContext& ctx) const {
    std::string quoted = PrefixLines(RichTextToMarkdown(Field(block.content, "rich_text")), "> ");
    std::string children = renderChildren(block.children, ctx, false);
    if (!children.empty()) {
        quoted += "\n" + PrefixLines(children, "> ");
    }
    return quoted;
}

std::string MarkdownRenderer::renderCallout(const Block& block, RenderContext& ctx) const {
    std::string icon;
    const json& iconData = Field(block.content, "icon");
    if (StringField(iconData, "type") == "emoji") {
        icon = StringField(iconData, "emoji");
    }
    const std::string firstPrefix = icon.empty() ? "> " : "> " + icon + " ";

    auto lines = TextUtils::SplitLines(RichTextToMarkdown(Field(block.content, "rich_text")));
    for (size_t i = 0; i < lines.size(); ++i) {
        lines[i] = (i == 0 ? firstPrefix : "> ") + lines[i];
    }
    std::string result = TextUtils::Join(lines, "\n");

    std::string children = renderChildren(block.children, ctx, false);
    if (!children.empty()) {
        result += "\n" + PrefixLines(children, "> ");
    }
    return result;
}

std::string MarkdownRenderer::renderImage(const Block& block, RenderContext& ctx) const {
    const std::string url = MediaUrl(block.content);
    if (url.empty()) {
        return "<!-- Image URL not found -->";
    }

    std::string reference = url;
    if (m_resolver) {
        std::optional<std::string> local;
        try {
            local = m_resolver(url, ctx.assetDir);
        } catch (const std::exception& e) {
            std::cerr << "[MarkdownRenderer] Asset resolution failed for " << url << ": " << e.what() << std::endl;
        }
        if (local) {
            ctx.assets.push_back(*local);
            const std::string filename = std::filesystem::path(*local).filename().string();
            reference = ctx.relativeAssetPrefix.empty() ? filename : ctx.relativeAssetPrefix + "/" + filename;
        }
    }

    const std::string caption = RichTextToMarkdown(Field(block.content, "caption"));
    const std::string alt = caption.empty() ? "Image" : caption;
    return "![" + alt + "](" + reference + ")" + CaptionLine(caption);
}

std::string MarkdownRenderer::renderVideo(const Block& block) const {
    const std::string url = MediaUrl(block.content);
    if (url.empty()) {
        return "<!-- Video URL not found -->";
    }
    const std::string caption = RichTextToMarkdown(Field(block.content, "caption"));
    std::string result = IsStreamingHost(url)
        ? "[![Video](" + url + ")](" + url + ")"
        : "[Video](" + url + ")";
    return result + CaptionLine(caption);
}

std::string MarkdownRenderer::renderEmbed(const Block& block) const {
    const std::string url = StringField(block.content, "url");
    if (url.empty()) {
        return "<!-- Embed URL not found -->";
    }
    const std::string caption = RichTextToMarkdown(Field(block.content, "caption"));
    return "🌐 [Embedded content](" + url + ")" + CaptionLine(caption);
}

std::string MarkdownRenderer::renderBookmark(const Block& block) const {
    const std::string url = StringField(block.content, "url");
    if (url.empty()) {
        return "<!-- Bookmark URL not found -->";
    }
    const std::string caption = RichTextToMarkdown(Field(block.content, "caption"));
    return "🔗 [" + (caption.empty() ? url : caption) + "](" + url + ")";
}

std::string MarkdownRenderer::renderLinkPreview(const Block& block) const {
    const std::string url = StringField(block.content, "url");
    if (url.empty()) {
        return "<!-- Link preview URL not found -->";
    }
    return "🔗 [" + url + "](" + url + ")";
}

std::string MarkdownRenderer::renderFile(const Block& block) const {
    const std::string url = MediaUrl(block.content);
    if (url.empty()) {
        return "<!-- File not found -->";
    }
    std::string name = StringField(block.content, "name");
    if (name.empty()) name = "File";
    return "📎 [" + name + "](" + url + ")";
}

std::string MarkdownRenderer::renderPdf(const Block& block) const {
    const std::string url = MediaUrl(block.content);
    if (url.empty()) {
        return "<!-- PDF not found -->";
    }
    const std::string caption = RichTextToMarkdown(Field(block.content, "caption"));
    return "📄 [PDF Document](" + url + ")" + CaptionLine(caption);
}

std::string MarkdownRenderer::renderAudio(const Block& block) const {
    const std::string url = MediaUrl(block.content);
    if (url.empty()) {
        return "<!-- Audio not found -->";
    }
    return "🎵 [Audio](" + url + ")";
}

std::string MarkdownRenderer::renderTable(const Block& block) const {
    const bool hasHeader = BoolField(block.content, "has_column_header");

    std::vector<std::string> rows;
    for (const auto& row : block.children) {
        if (row.type != BlockType::TableRow) continue;

        std::vector<std::string> cells;
        const json& rawCells = Field(row.content, "cells");
        if (rawCells.is_array()) {
            for (const auto& cell : rawCells) {
                cells.push_back(RichTextToMarkdown(cell));
            }
        }
        rows.push_back("| " + TextUtils::Join(cells, " | ") + " |");

        if (rows.size() == 1 && hasHeader) {
            std::string separator = "|";
            for (size_t i = 0; i < cells.size(); ++i) separator += "---|";
            rows.push_back(separator);
        }
    }

    if (rows.empty()) {
        return "<!-- Empty table -->";
    }
    return TextUtils::Join(rows, "\n");
}

std::optional<std::string> MarkdownRenderer::renderColumnList(const Block& block, RenderContext& ctx) const {
    std::vector<std::string> parts;
    for (const auto& column : block.children) {
        std::string content = renderChildren(column.children, ctx, false);
        if (!content.empty()) {
            parts.push_back(std::move(content));
        }
    }
    if (parts.empty()) return std::nullopt;
    return TextUtils::Join(parts, "\n\n");
}

std::optional<std::string> MarkdownRenderer::renderSyncedBlock(const Block& block, RenderContext& ctx) const {
    std::string content = renderChildren(block.children, ctx, false);
    if (content.empty()) return std::nullopt;
    return content;
}

std::string MarkdownRenderer::RichTextToMarkdown(const json& richText) {
    if (!richText.is_array()) return "";

    std::string out;
    for (const auto& span : richText) {
        std::string content = StringField(span, "plain_text");
        if (content.empty()) {
            content = StringField(Field(span, "text"), "content");
        }
        const json& annotations = Field(span, "annotations");

        if (BoolField(annotations, "code")) content = "`" + content + "`";
        if (BoolField(annotations, "bold")) content = "**" + content + "**";
        if (BoolField(annotations, "italic")) content = "*" + content + "*";
        if (BoolField(annotations, "strikethrough")) content = "~~" + content + "~~";
        if (BoolField(annotations, "underline")) content = "<u>" + content + "</u>";

        const std::string href = StringField(span, "href");
        if (!href.empty()) content = "[" + content + "](" + href + ")";

        out += content;
    }
    return out;
}

bool MarkdownRenderer::NeedsSpacing(BlockType previous, BlockType current) {
    if (domain::IsHeading(previous) || domain::IsHeading(current)) return true;
    if (domain::IsListItem(previous) != domain::IsListItem(current)) return true;
    if (previous == BlockType::Code || current == BlockType::Code) return true;
    if (previous == BlockType::Divider || current == BlockType::Divider) return true;
    return false;
}

std::string MarkdownRenderer::MapCodeLanguage(const std::string& label) {
    static const std::unordered_map<std::string, std::string> kLanguages = {
        {"plain text", ""},
        {"javascript", "javascript"},
        {"typescript", "typescript"},
        {"python", "python"},
        {"java", "java"},
        {"c++", "cpp"},
        {"c#", "csharp"},
        {"ruby", "ruby"},
        {"go", "go"},
        {"rust", "rust"},
        {"shell", "bash"},
        {"bash", "bash"},
        {"sql", "sql"},
        {"json", "json"},
        {"yaml", "yaml"},
        {"xml", "xml"},
        {"html", "html"},
        {"css", "css"},
        {"markdown", "markdown"},
        {"dockerfile", "dockerfile"},
    };

    const std::string lowered = TextUtils::ToLower(label);
    auto it = kLanguages.find(lowered);
    return it != kLanguages.end() ? it->second : lowered;
}

std::string MarkdownRenderer::NormalizeWhitespace(const std::string& content) {
    std::vector<std::string> result;
    int blankCount = 0;

    for (auto line : TextUtils::SplitLines(content)) {
        auto end = line.find_last_not_of(" \t\r");
        line.erase(end == std::string::npos ? 0 : end + 1);

        if (line.empty()) {
            if (++blankCount <= 2) result.push_back(line);
        } else {
            blankCount = 0;
            result.push_back(std::move(line));
        }
    }

    while (!result.empty() && result.front().empty()) result.erase(result.begin());
    while (!result.empty() && result.back().empty()) result.pop_back();
    return TextUtils::Join(result, "\n") + "\n";
}

} // namespace notesync::application
