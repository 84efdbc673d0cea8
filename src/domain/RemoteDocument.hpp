/**
 * @file RemoteDocument.hpp
 * @brief Metadata of one remote page mirrored into the local tree.
 */

#pragma once
#include <string>
#include <optional>
#include "domain/Timestamp.hpp"

namespace notesync::domain {

/**
 * @struct RemoteDocument
 * @brief A child page of the configured parent page.
 */
struct RemoteDocument {
    std::string id;                   ///< Page id without dashes.
    std::string title;
    TimePoint lastEditedTime;
    TimePoint createdTime;
    std::string url;
    std::optional<std::string> icon;  ///< Emoji or external icon URL.
    std::optional<std::string> cover; ///< Cover image URL.
};

} // namespace notesync::domain
