#include <cassert>
#include <iostream>

#include "domain/TextUtils.hpp"

using notesync::domain::TextUtils;

namespace {

void TestStringHelpers() {
    std::cout << "[Test] Trim, case and join helpers..." << std::endl;
    assert(TextUtils::Trim("  \tvalue \r\n") == "value");
    assert(TextUtils::Trim(" \n ").empty());
    assert(TextUtils::ToLower("README.MD") == "readme.md");
    assert(TextUtils::Join({"a", "b", "c"}, ", ") == "a, b, c");
    assert(TextUtils::Join({}, ", ").empty());

    auto lines = TextUtils::SplitLines("one\n\ntwo\n");
    assert((lines == std::vector<std::string>{"one", "", "two", ""}));

    std::string text = "a&b&c";
    TextUtils::ReplaceAll(text, "&", " and ");
    assert(text == "a and b and c");
    std::cout << "[PASS] String helpers." << std::endl;
}

void TestUtf8() {
    std::cout << "[Test] UTF-8 decoding and classification..." << std::endl;
    const std::string text = "e\xC3\xA9\xE2\x80\xA6\xF0\x9F\x9A\x80\xFF";
    size_t pos = 0;
    char32_t cp = 0;

    assert(TextUtils::NextCodePoint(text, pos, cp) && cp == U'e' && pos == 1);
    assert(TextUtils::NextCodePoint(text, pos, cp) && cp == 0x00E9 && pos == 3);
    assert(TextUtils::NextCodePoint(text, pos, cp) && cp == 0x2026 && pos == 6);
    assert(TextUtils::NextCodePoint(text, pos, cp) && cp == 0x1F680 && pos == 10);
    assert(!TextUtils::NextCodePoint(text, pos, cp) && pos == 11);

    // Truncated sequence at the end of the input.
    const std::string truncated = "\xE2\x80";
    pos = 0;
    assert(!TextUtils::NextCodePoint(truncated, pos, cp) && pos == 1);

    assert(TextUtils::EncodeUtf8(0x00E9) == "\xC3\xA9");
    assert(TextUtils::EncodeUtf8(0x1F680) == "\xF0\x9F\x9A\x80");

    assert(TextUtils::IsWordCodePoint(0x00E9));
    assert(TextUtils::IsWordCodePoint(0x043B));
    assert(TextUtils::IsWordCodePoint(0x65E5));
    assert(!TextUtils::IsWordCodePoint(0x00D7));
    assert(!TextUtils::IsWordCodePoint(0x2019));
    assert(!TextUtils::IsWordCodePoint(0x2026));
    assert(!TextUtils::IsWordCodePoint(0x2764));
    assert(!TextUtils::IsWordCodePoint(0x1F680));
    assert(!TextUtils::IsWordCodePoint(0x3002));

    assert(TextUtils::IsSpaceCodePoint(0x00A0));
    assert(!TextUtils::IsSpaceCodePoint(0x200D));

    assert(TextUtils::ToLowerCodePoint(0x00C9) == 0x00E9);
    assert(TextUtils::ToLowerCodePoint(0x00D7) == 0x00D7);
    assert(TextUtils::ToLowerCodePoint(0x041B) == 0x043B);
    assert(TextUtils::ToLowerCodePoint(0x0401) == 0x0451);
    std::cout << "[PASS] Code points decoded and classified." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TextUtils Test..." << std::endl;
    TestStringHelpers();
    TestUtf8();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
