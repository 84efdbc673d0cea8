/**
 * @file AssetResolver.hpp
 * @brief Downloads referenced assets into content-addressed local files.
 */

#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "infrastructure/PersistenceService.hpp"

namespace notesync::infrastructure {

/**
 * @class AssetResolver
 * @brief Maps a remote URL to a local file under a target directory.
 *
 * The filename is derived from an MD5 of the URL, so a second resolve of the
 * same URL finds the file on disk and skips the download.
 */
class AssetResolver {
public:
    /** @brief Fetch capability: URL -> bytes, or std::nullopt on failure. */
    using Fetcher = std::function<std::optional<std::string>(const std::string& url)>;

    AssetResolver(Fetcher fetcher, std::shared_ptr<PersistenceService> persistence);

    /**
     * @brief Returns the local path for a URL, downloading it if missing.
     * @param url Remote asset URL.
     * @param targetDir Directory that receives the file (created on demand).
     * @param filename Explicit filename; derived from the URL when empty.
     * @return Local path, or std::nullopt if the fetch or the write failed.
     */
    std::optional<std::string> resolve(const std::string& url,
                                       const std::string& targetDir,
                                       const std::optional<std::string>& filename = std::nullopt);

    /** @brief "image-<12 hex chars of md5(url)><ext>", ext defaulting to ".png". */
    static std::string DeriveFilename(const std::string& url);

    /** @brief Lowercase hex MD5 digest. */
    static std::string Md5Hex(const std::string& data);

    /** @brief Number of assets actually downloaded (cache hits excluded). */
    int downloadCount() const { return m_downloads; }

private:
    Fetcher m_fetcher;
    std::shared_ptr<PersistenceService> m_persistence;
    int m_downloads = 0;
};

} // namespace notesync::infrastructure
