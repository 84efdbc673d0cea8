/**
 * @file Block.hpp
 * @brief Domain entity representing one node of a remote document's block tree.
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace notesync::domain {

/**
 * @enum BlockType
 * @brief Fixed enumeration of the block kinds the renderer understands.
 */
enum class BlockType {
    Paragraph,
    Heading1,
    Heading2,
    Heading3,
    BulletedListItem,
    NumberedListItem,
    ToDo,
    Toggle,
    Code,
    Quote,
    Callout,
    Divider,
    Image,
    Video,
    File,
    Audio,
    Pdf,
    Embed,
    Bookmark,
    LinkPreview,
    Table,
    TableRow,
    ColumnList,
    Column,
    ChildPage,
    ChildDatabase,
    SyncedBlock,
    Template,
    Equation,
    Breadcrumb,
    TableOfContents,
    Unknown
};

/** @brief Maps an API type name ("heading_1", "to_do", ...) to a BlockType. */
BlockType BlockTypeFromString(const std::string& name);

/** @brief Returns the canonical API type name. Unknown maps to "unsupported". */
std::string BlockTypeToString(BlockType type);

bool IsHeading(BlockType type);
bool IsListItem(BlockType type);

/**
 * @struct Block
 * @brief A block with its type-specific payload and eagerly fetched children.
 *
 * `children` is only populated when `hasChildren` was true at fetch time.
 */
struct Block {
    std::string id;                ///< Block id without dashes.
    BlockType type = BlockType::Unknown;
    std::string typeName;          ///< Raw type name as reported by the source.
    nlohmann::json content = nlohmann::json::object(); ///< Payload under the type key.
    bool hasChildren = false;
    std::vector<Block> children;

    /** @brief Builds a block whose type is resolved from its raw name. */
    static Block Make(std::string id, const std::string& typeName, nlohmann::json content = nlohmann::json::object()) {
        Block block;
        block.id = std::move(id);
        block.typeName = typeName;
        block.type = BlockTypeFromString(typeName);
        block.content = content.is_object() ? std::move(content) : nlohmann::json::object();
        return block;
    }
};

} // namespace notesync::domain
