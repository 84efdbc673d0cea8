/**
 * @file Block.cpp
 * @brief Implementation of Block.
 */

#include "domain/Block.hpp"
#include <unordered_map>

namespace notesync::domain {

namespace {

const std::unordered_map<std::string, BlockType>& TypeTable() {
    static const std::unordered_map<std::string, BlockType> table = {
        {"paragraph", BlockType::Paragraph},
        {"heading_1", BlockType::Heading1},
        {"heading_2", BlockType::Heading2},
        {"heading_3", BlockType::Heading3},
        {"bulleted_list_item", BlockType::BulletedListItem},
        {"numbered_list_item", BlockType::NumberedListItem},
        {"to_do", BlockType::ToDo},
        {"toggle", BlockType::Toggle},
        {"code", BlockType::Code},
        {"quote", BlockType::Quote},
        {"callout", BlockType::Callout},
        {"divider", BlockType::Divider},
        {"image", BlockType::Image},
        {"video", BlockType::Video},
        {"file", BlockType::File},
        {"audio", BlockType::Audio},
        {"pdf", BlockType::Pdf},
        {"embed", BlockType::Embed},
        {"bookmark", BlockType::Bookmark},
        {"link_preview", BlockType::LinkPreview},
        {"table", BlockType::Table},
        {"table_row", BlockType::TableRow},
        {"column_list", BlockType::ColumnList},
        {"column", BlockType::Column},
        {"child_page", BlockType::ChildPage},
        {"child_database", BlockType::ChildDatabase},
        {"synced_block", BlockType::SyncedBlock},
        {"template", BlockType::Template},
        {"equation", BlockType::Equation},
        {"breadcrumb", BlockType::Breadcrumb},
        {"table_of_contents", BlockType::TableOfContents},
    };
    return table;
}

} // namespace

BlockType BlockTypeFromString(const std::string& name) {
    const auto& table = TypeTable();
    auto it = table.find(name);
    return it != table.end() ? it->second : BlockType::Unknown;
}

std::string BlockTypeToString(BlockType type) {
    for (const auto& [name, value] : TypeTable()) {
        if (value == type) return name;
    }
    return "unsupported";
}

bool IsHeading(BlockType type) {
    return type == BlockType::Heading1 || type == BlockType::Heading2 || type == BlockType::Heading3;
}

bool IsListItem(BlockType type) {
    return type == BlockType::BulletedListItem || type == BlockType::NumberedListItem || type == BlockType::ToDo;
}

} // namespace notesync::domain
