/**
 * @file AssetResolver.cpp
 * @brief Implementation of AssetResolver.
 */

#include "infrastructure/AssetResolver.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <openssl/evp.h>

namespace notesync::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr size_t kHashLength = 12;
constexpr const char* kDefaultExtension = ".png";
constexpr std::array<const char*, 6> kImageExtensions = {".png", ".jpg", ".jpeg", ".gif", ".webp", ".svg"};

std::string ToHex(const unsigned char* d, size_t n) {
    static const char* H = "0123456789abcdef";
    std::string s;
    s.resize(n * 2);
    for (size_t i = 0; i < n; i++) {
        s[2 * i] = H[(d[i] >> 4) & 0xF];
        s[2 * i + 1] = H[d[i] & 0xF];
    }
    return s;
}

// Path component of a URL, without scheme, host, query or fragment.
std::string UrlPath(const std::string& url) {
    size_t start = 0;
    auto schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        start = url.find('/', schemeEnd + 3);
        if (start == std::string::npos) return "";
    }
    size_t end = url.find_first_of("?#", start);
    return url.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

} // namespace

AssetResolver::AssetResolver(Fetcher fetcher, std::shared_ptr<PersistenceService> persistence)
    : m_fetcher(std::move(fetcher)), m_persistence(std::move(persistence)) {}

std::string AssetResolver::Md5Hex(const std::string& data) {
    EVP_MD_CTX* md = EVP_MD_CTX_new();
    if (!md) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(md, EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(md, data.data(), data.size()) != 1) {
        EVP_MD_CTX_free(md);
        throw std::runtime_error("EVP digest failed");
    }

    unsigned char mdBuf[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (EVP_DigestFinal_ex(md, mdBuf, &mdLen) != 1) {
        EVP_MD_CTX_free(md);
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    EVP_MD_CTX_free(md);
    return ToHex(mdBuf, mdLen);
}

std::string AssetResolver::DeriveFilename(const std::string& url) {
    std::string ext = domain::TextUtils::ToLower(fs::path(UrlPath(url)).extension().string());
    if (std::find(kImageExtensions.begin(), kImageExtensions.end(), ext) == kImageExtensions.end()) {
        ext = kDefaultExtension;
    }
    return "image-" + Md5Hex(url).substr(0, kHashLength) + ext;
}

std::optional<std::string> AssetResolver::resolve(const std::string& url,
                                                  const std::string& targetDir,
                                                  const std::optional<std::string>& filename) {
    try {
        const std::string name = (filename && !filename->empty()) ? *filename : DeriveFilename(url);
        const fs::path targetPath = fs::path(targetDir) / name;

        if (fs::exists(targetPath)) {
            return targetPath.string();
        }
        if (!m_fetcher) {
            return std::nullopt;
        }

        auto bytes = m_fetcher(url);
        if (!bytes) {
            std::cerr << "[AssetResolver] Warning: Failed to download " << url << std::endl;
            return std::nullopt;
        }
        if (!m_persistence->saveBinary(targetPath.string(), *bytes)) {
            std::cerr << "[AssetResolver] Warning: Error saving " << targetPath << std::endl;
            return std::nullopt;
        }

        ++m_downloads;
        return targetPath.string();
    } catch (const std::exception& e) {
        std::cerr << "[AssetResolver] Warning: " << url << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // namespace notesync::infrastructure
