/**
 * @file PersistenceService.hpp
 * @brief Centralized service for atomic file I/O operations.
 */

#pragma once
#include <optional>
#include <string>

namespace notesync::infrastructure {

/**
 * @class PersistenceService
 * @brief Writes files through a temp file and a rename so readers never see partial content.
 *
 * All writes happen on the calling thread; the sync pipeline is single-threaded.
 */
class PersistenceService {
public:
    /**
     * @brief Atomically replaces a file with the given content (created with parents if needed).
     * @param filename Target path.
     * @param content Bytes to write.
     * @return True on success. Failures are logged.
     */
    bool saveText(const std::string& filename, const std::string& content);

    /** @brief Same as saveText, for binary payloads such as downloaded images. */
    bool saveBinary(const std::string& filename, const std::string& bytes);

    /** @brief Reads a whole file. @return std::nullopt if it cannot be opened. */
    std::optional<std::string> readText(const std::string& filename) const;

private:
    /**
     * @brief Performs the actual atomic write (temp -> rename).
     */
    bool performAtomicWrite(const std::string& filename, const std::string& content, bool binary);
};

} // namespace notesync::infrastructure
