#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "infrastructure/AssetResolver.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace notesync::infrastructure;

namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting AssetResolver Test..." << std::endl;

    const fs::path testRoot = "test_project_root_assets";
    fs::remove_all(testRoot);

    // Derived filenames
    assert(AssetResolver::Md5Hex("") == "d41d8cd98f00b204e9800998ecf8427e");
    const std::string url = "https://files.example.com/space/diagram.JPG?X-Amz-Signature=abc";
    const std::string name = AssetResolver::DeriveFilename(url);
    assert(name == "image-" + AssetResolver::Md5Hex(url).substr(0, 12) + ".jpg");
    assert(AssetResolver::DeriveFilename("https://example.com/blob") ==
           "image-" + AssetResolver::Md5Hex("https://example.com/blob").substr(0, 12) + ".png");
    assert(AssetResolver::DeriveFilename("https://example.com/a.tiff").size() == std::string("image-").size() + 12 + 4);
    std::cout << "[PASS] Content-addressed filenames." << std::endl;

    int fetches = 0;
    auto persistence = std::make_shared<PersistenceService>();
    AssetResolver resolver([&fetches](const std::string&) -> std::optional<std::string> {
        ++fetches;
        return std::string("\x89PNG\r\n", 6);
    }, persistence);

    const fs::path assetDir = testRoot / "linux" / "images";
    auto first = resolver.resolve(url, assetDir.string());
    assert(first && fs::path(*first).filename() == name);
    assert(fs::exists(*first));
    assert(fetches == 1);

    auto second = resolver.resolve(url, assetDir.string());
    assert(second == first);
    assert(fetches == 1);
    assert(resolver.downloadCount() == 1);
    std::cout << "[PASS] Existing file returned without fetching." << std::endl;

    auto named = resolver.resolve(url, assetDir.string(), std::string("cover.png"));
    assert(named && fs::path(*named).filename() == "cover.png");
    assert(fetches == 2);

    AssetResolver failing([](const std::string&) -> std::optional<std::string> {
        return std::nullopt;
    }, persistence);
    assert(!failing.resolve("https://example.com/missing.png", assetDir.string()));

    AssetResolver throwing([](const std::string&) -> std::optional<std::string> {
        throw std::runtime_error("timeout");
    }, persistence);
    assert(!throwing.resolve("https://example.com/slow.png", assetDir.string()));
    std::cout << "[PASS] Fetch failures degrade to none." << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
