/**
 * @file MarkdownRenderer.hpp
 * @brief Converts a block tree into canonical Markdown.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Block.hpp"

namespace notesync::application {

/**
 * @struct RenderContext
 * @brief Per-conversion state threaded through the recursion.
 *
 * One context per top-level render() call. Child scopes save and restore
 * `indentLevel` and `numberedCounter` on return.
 */
struct RenderContext {
    std::string assetDir;              ///< Where resolved assets are stored.
    std::string relativeAssetPrefix;   ///< Prefix used in emitted asset references.
    std::vector<std::string> assets;   ///< Resolved asset paths, in encounter order.
    int indentLevel = 0;
    int numberedCounter = 0;
};

/**
 * @struct RenderResult
 * @brief Rendered text and the local assets it references.
 */
struct RenderResult {
    std::string text;
    std::vector<std::string> assets;
};

/**
 * @class MarkdownRenderer
 * @brief Stateless renderer from blocks to Markdown.
 *
 * Never throws on malformed payloads: every field read has a default. The only
 * external effect is the injected asset resolver, whose failure degrades to
 * embedding the original URL.
 */
class MarkdownRenderer {
public:
    /**
     * @brief Resolves a remote asset into a local file.
     * @return Local path of the stored file, or std::nullopt on failure.
     */
    using AssetResolveFn = std::function<std::optional<std::string>(const std::string& url, const std::string& targetDir)>;

    explicit MarkdownRenderer(AssetResolveFn resolver = nullptr);

    /**
     * @brief Renders a sequence of top-level blocks.
     * @param blocks Fully expanded block tree.
     * @param assetDir Directory where images are stored.
     * @param relativeAssetPrefix Prefix for image references in the output.
     */
    RenderResult render(const std::vector<domain::Block>& blocks,
                        const std::string& assetDir,
                        const std::string& relativeAssetPrefix = "images") const;

    /** @brief Concatenates styled spans: code, bold, italic, strike, underline, then link. */
    static std::string RichTextToMarkdown(const nlohmann::json& richText);

    /** @brief Blank-line rule between two adjacent top-level blocks. */
    static bool NeedsSpacing(domain::BlockType previous, domain::BlockType current);

    /** @brief Maps a free-text language label to a fence tag. */
    static std::string MapCodeLanguage(const std::string& label);

    /** @brief Strips trailing spaces, caps blank runs at two, ends with one newline. */
    static std::string NormalizeWhitespace(const std::string& content);

private:
    std::optional<std::string> renderBlock(const domain::Block& block, RenderContext& ctx) const;
    std::string renderChildren(const std::vector<domain::Block>& children, RenderContext& ctx, bool indent) const;

    std::string renderText(const domain::Block& block, RenderContext& ctx, const std::string& prefix) const;
    std::string renderHeading(const domain::Block& block, int level) const;
    std::string renderNumbered(const domain::Block& block, RenderContext& ctx) const;
    std::string renderToDo(const domain::Block& block, RenderContext& ctx) const;
    std::string renderToggle(const domain::Block& block, RenderContext& ctx) const;
    std::string renderCode(const domain::Block& block) const;
    std::string renderQuote(const domain::Block& block, RenderContext& ctx) const;
    std::string renderCallout(const domain::Block& block, RenderContext& ctx) const;
    std::string renderImage(const domain::Block& block, RenderContext& ctx) const;
    std::string renderVideo(const domain::Block& block) const;
    std::string renderEmbed(const domain::Block& block) const;
    std::string renderBookmark(const domain::Block& block) const;
    std::string renderLinkPreview(const domain::Block& block) const;
    std::string renderFile(const domain::Block& block) const;
    std::string renderPdf(const domain::Block& block) const;
    std::string renderAudio(const domain::Block& block) const;
    std::string renderTable(const domain::Block& block) const;
    std::optional<std::string> renderColumnList(const domain::Block& block, RenderContext& ctx) const;
    std::optional<std::string> renderSyncedBlock(const domain::Block& block, RenderContext& ctx) const;

    AssetResolveFn m_resolver;
};

} // namespace notesync::application
