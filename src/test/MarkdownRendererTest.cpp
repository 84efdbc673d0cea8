#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "application/MarkdownRenderer.hpp"

using namespace notesync;
using application::MarkdownRenderer;
using domain::Block;
using json = nlohmann::json;

namespace {

json Text(const std::string& content, json annotations = json::object(), const std::string& href = "") {
    json span = {{"plain_text", content}, {"annotations", annotations}};
    if (!href.empty()) span["href"] = href;
    return span;
}

Block TextBlock(const std::string& type, const std::string& content) {
    return Block::Make("id-" + content, type, {{"rich_text", json::array({Text(content)})}});
}

Block WithChildren(Block block, std::vector<Block> children) {
    block.hasChildren = true;
    block.children = std::move(children);
    return block;
}

std::string Render(const std::vector<Block>& blocks) {
    MarkdownRenderer renderer;
    return renderer.render(blocks, "/tmp/unused").text;
}

void TestSpacingAroundHeadings() {
    std::cout << "[Test] Heading spacing..." << std::endl;
    std::string out = Render({
        TextBlock("heading_1", "Title"),
        TextBlock("paragraph", "First"),
        TextBlock("paragraph", "Second"),
        TextBlock("heading_2", "Section"),
    });
    assert(out == "# Title\n\nFirst\nSecond\n\n## Section\n");
    std::cout << "[PASS] Headings are separated by blank lines." << std::endl;
}

void TestNumberedCounterReset() {
    std::cout << "[Test] Numbered list counter..." << std::endl;
    std::string out = Render({
        TextBlock("numbered_list_item", "a"),
        TextBlock("numbered_list_item", "b"),
        TextBlock("paragraph", "break"),
        TextBlock("numbered_list_item", "c"),
    });
    assert(out == "1. a\n2. b\n\nbreak\n\n1. c\n");
    std::cout << "[PASS] Counter restarts after an interruption." << std::endl;
}

void TestNestedLists() {
    std::cout << "[Test] Nested list indentation..." << std::endl;
    Block outer = WithChildren(TextBlock("bulleted_list_item", "outer"), {
        TextBlock("numbered_list_item", "one"),
        WithChildren(TextBlock("numbered_list_item", "two"), {
            TextBlock("bulleted_list_item", "deep"),
        }),
    });
    std::string out = Render({outer, TextBlock("bulleted_list_item", "next")});
    assert(out == "- outer\n  1. one\n  2. two\n    - deep\n- next\n");
    std::cout << "[PASS] Each nesting level adds two spaces." << std::endl;
}

void TestChecklist() {
    std::cout << "[Test] Checklist items..." << std::endl;
    Block done = Block::Make("t1", "to_do", {{"rich_text", json::array({Text("done")})}, {"checked", true}});
    Block open = Block::Make("t2", "to_do", {{"rich_text", json::array({Text("open")})}, {"checked", false}});
    assert(Render({done, open}) == "- [x] done\n- [ ] open\n");
    std::cout << "[PASS] Checked and unchecked markers." << std::endl;
}

void TestInlineFormatting() {
    std::cout << "[Test] Inline formatting order..." << std::endl;
    json spans = json::array({
        Text("plain "),
        Text("both", {{"bold", true}, {"italic", true}}),
        Text(" "),
        Text("x", {{"code", true}, {"bold", true}}),
        Text(" "),
        Text("gone", {{"strikethrough", true}, {"underline", true}}),
        Text(" "),
        Text("site", {{"bold", true}}, "https://example.com"),
    });
    std::string md = MarkdownRenderer::RichTextToMarkdown(spans);
    assert(md == "plain ***both*** **`x`** <u>~~gone~~</u> [**site**](https://example.com)");
    assert(MarkdownRenderer::RichTextToMarkdown(json("not an array")).empty());
    std::cout << "[PASS] Styles applied in fixed order, link last." << std::endl;
}

void TestCodeBlock() {
    std::cout << "[Test] Code blocks..." << std::endl;
    Block code = Block::Make("c1", "code", {
        {"rich_text", json::array({Text("int x = 0;")})},
        {"language", "C++"},
        {"caption", json::array({Text("example")})},
    });
    assert(Render({code}) == "```cpp\nint x = 0;\n```\n*example*\n");

    assert(MarkdownRenderer::MapCodeLanguage("Plain Text").empty());
    assert(MarkdownRenderer::MapCodeLanguage("Shell") == "bash");
    assert(MarkdownRenderer::MapCodeLanguage("c#") == "csharp");
    assert(MarkdownRenderer::MapCodeLanguage("Haskell") == "haskell");
    assert(MarkdownRenderer::MapCodeLanguage("").empty());
    std::cout << "[PASS] Language mapping and caption." << std::endl;
}

void TestQuoteCalloutToggle() {
    std::cout << "[Test] Quote, callout and toggle..." << std::endl;
    Block quote = WithChildren(TextBlock("quote", "said"), {TextBlock("paragraph", "more")});
    assert(Render({quote}) == "> said\n> more\n");

    Block callout = Block::Make("co", "callout", {
        {"rich_text", json::array({Text("note")})},
        {"icon", {{"type", "emoji"}, {"emoji", "💡"}}},
    });
    assert(Render({callout}) == "> 💡 note\n");

    Block toggle = WithChildren(TextBlock("toggle", "More"), {TextBlock("paragraph", "hidden")});
    assert(Render({toggle}) == "<details>\n<summary>More</summary>\n\nhidden\n</details>\n");
    std::cout << "[PASS] Container blocks render children unindented." << std::endl;
}

void TestTable() {
    std::cout << "[Test] Table with header..." << std::endl;
    Block table = Block::Make("tb", "table", {{"has_column_header", true}, {"table_width", 2}});
    table.hasChildren = true;
    table.children = {
        Block::Make("r1", "table_row", {{"cells", json::array({json::array({Text("a")}), json::array({Text("b")})})}}),
        Block::Make("r2", "table_row", {{"cells", json::array({json::array({Text("1")}), json::array({Text("2")})})}}),
    };
    assert(Render({table}) == "| a | b |\n|---|---|\n| 1 | 2 |\n");

    Block empty = Block::Make("te", "table", {{"has_column_header", true}});
    assert(Render({empty}) == "<!-- Empty table -->\n");
    std::cout << "[PASS] Header separator follows the first row." << std::endl;
}

void TestUnknownBlockKeepsStructure() {
    std::cout << "[Test] Unknown block type..." << std::endl;
    std::string out = Render({
        TextBlock("heading_2", "Top"),
        Block::Make("u1", "ai_block"),
        TextBlock("bulleted_list_item", "item"),
    });
    assert(out == "## Top\n\n<!-- Unsupported block type: ai_block -->\n\n- item\n");
    std::cout << "[PASS] Unsupported marker, spacing preserved." << std::endl;
}

void TestMediaFallbacks() {
    std::cout << "[Test] Media blocks..." << std::endl;
    Block video = Block::Make("v1", "video", {{"type", "external"}, {"external", {{"url", "https://www.youtube.com/watch?v=abc"}}}});
    assert(Render({video}) == "[![Video](https://www.youtube.com/watch?v=abc)](https://www.youtube.com/watch?v=abc)\n");

    Block plainVideo = Block::Make("v2", "video", {{"type", "file"}, {"file", {{"url", "https://cdn.example.com/v.mp4"}}}});
    assert(Render({plainVideo}) == "[Video](https://cdn.example.com/v.mp4)\n");

    assert(Render({Block::Make("i0", "image")}) == "<!-- Image URL not found -->\n");
    assert(Render({Block::Make("b0", "bookmark", {{"url", "https://example.com"}})}) ==
           "🔗 [https://example.com](https://example.com)\n");
    assert(Render({Block::Make("f0", "file", {{"type", "file"}, {"file", {{"url", "https://x/y.zip"}}}, {"name", "y.zip"}})}) ==
           "📎 [y.zip](https://x/y.zip)\n");
    assert(Render({Block::Make("b1", "breadcrumb")}) == "\n");
    std::cout << "[PASS] Media references and missing-URL markers." << std::endl;
}

void TestImageResolution() {
    std::cout << "[Test] Image asset resolution..." << std::endl;
    Block image = Block::Make("img", "image", {
        {"type", "file"},
        {"file", {{"url", "https://files.example.com/pic.png?sig=1"}}},
        {"caption", json::array({Text("Diagram")})},
    });

    MarkdownRenderer resolving([](const std::string&, const std::string& dir) -> std::optional<std::string> {
        return dir + "/image-abc.png";
    });
    auto ok = resolving.render({image}, "/repo/topic/images", "images");
    assert(ok.text == "![Diagram](images/image-abc.png)\n*Diagram*\n");
    assert(ok.assets.size() == 1 && ok.assets[0] == "/repo/topic/images/image-abc.png");

    MarkdownRenderer failing([](const std::string&, const std::string&) -> std::optional<std::string> {
        return std::nullopt;
    });
    auto fallback = failing.render({image}, "/repo/topic/images", "images");
    assert(fallback.text == "![Diagram](https://files.example.com/pic.png?sig=1)\n*Diagram*\n");
    assert(fallback.assets.empty());
    std::cout << "[PASS] Local reference on success, original URL on failure." << std::endl;
}

void TestIdempotenceAndNormalization() {
    std::cout << "[Test] Idempotence and whitespace..." << std::endl;
    std::vector<Block> blocks = {
        TextBlock("heading_1", "A"),
        Block::Make("d", "divider"),
        TextBlock("paragraph", "B"),
    };
    assert(Render(blocks) == Render(blocks));
    assert(MarkdownRenderer::NormalizeWhitespace("\n\na  \n\n\n\n\nb\t\n\n") == "a\n\n\nb\n");
    std::cout << "[PASS] Byte-identical output, blank runs capped." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting MarkdownRenderer Test..." << std::endl;

    TestSpacingAroundHeadings();
    TestNumberedCounterReset();
    TestNestedLists();
    TestChecklist();
    TestInlineFormatting();
    TestCodeBlock();
    TestQuoteCalloutToggle();
    TestTable();
    TestUnknownBlockKeepsStructure();
    TestMediaFallbacks();
    TestImageResolution();
    TestIdempotenceAndNormalization();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
