/**
 * @file SyncPolicy.hpp
 * @brief Skip/re-render decision based on the persisted high-water mark.
 */

#pragma once
#include <string>
#include "domain/DocumentState.hpp"
#include "domain/RemoteDocument.hpp"

namespace notesync::domain {

class SyncPolicy {
public:
    /**
     * @brief True when forced, when there is no prior state, or when the
     * remote modification time is strictly later than the recorded one.
     * An unparseable recorded time counts as no prior state.
     */
    static bool ShouldSync(const RemoteDocument& document, const DocumentState* prior, bool force);

    /** @brief Builds the record stored after a successful render. */
    static DocumentState Record(const RemoteDocument& document, const std::string& directory,
                                TimePoint syncedAt = Timestamp::Now());
};

} // namespace notesync::domain
