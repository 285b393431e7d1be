#include <regex>

#include "site.hpp"
#include "markdown_extensions.hpp"
#include "helpers.hpp"



static bool is_headline(std::string_view line) {
    size_t level = 0;
    while (level < line.size() && line[level] == '#') {
        level++;
    }

    // maddy needs the space, a bare "#" is paragraph text
    return level >= 1 && level <= 6 && level < line.size() && line[level] == ' ';
}

static bool is_horizontal_line(std::string_view line) {
    return line == "---" || line == "***" || line == "___";
}



// Reduces inline markdown to the text a reader sees.
static std::string strip_inline_markup(std::string text) {
    static const std::regex footnote_test("\\[\\^[^\\]\\s]+\\]");
    static const std::regex image_test("!\\[([^\\]]*)\\]\\([^\\)]*\\)");
    static const std::regex link_test("\\[([^\\]]*)\\]\\([^\\)]*\\)");
    static const std::regex code_test("`+([^`]*)`+");
    static const std::regex strong_test("(\\*\\*|__|~~)(.+?)\\1");
    static const std::regex star_emphasis_test("\\*(\\S(?:.*?\\S)?)\\*");
    static const std::regex underscore_emphasis_test("(^|[^A-Za-z0-9_])_(\\S(?:.*?\\S)?)_(?=[^A-Za-z0-9_]|$)");

    text = std::regex_replace(text, footnote_test, "");
    text = std::regex_replace(text, image_test, "$1");
    text = std::regex_replace(text, link_test, "$1");
    text = std::regex_replace(text, code_test, "$1");
    text = std::regex_replace(text, strong_test, "$2");
    text = std::regex_replace(text, star_emphasis_test, "$1");
    text = std::regex_replace(text, underscore_emphasis_test, "$1$2");

    return remove_html_tags(text);
}

static std::string clean_title(std::string_view heading_text) {
    std::string_view text = trim_whitespace(heading_text);

    // Optional closing sequence: "# Title ##"
    size_t last = text.find_last_not_of('#');
    if (last == std::string_view::npos) {
        text = {};
    } else if (last + 1 < text.size() && text[last] == ' ') {
        text = trim_whitespace(text.substr(0, last));
    }

    std::string title = strip_inline_markup(std::string(text));
    title = decode_html_entities(title);
    title = mdblog::apply_smart_punctuation(title);

    return std::string(trim_whitespace(title));
}



// maddy starts a headline only at the beginning of a block, a "# " line inside a paragraph is paragraph text.
std::optional<std::string> mdblog::extract_title(std::string_view markdown) {
    std::string normalized = normalize_line_endings(markdown);

    bool inside_code_block = false;
    bool block_start = true;

    for (auto line : split_lines(normalized)) {
        if (is_code_fence(line)) {
            inside_code_block = !inside_code_block;
            block_start = !inside_code_block;
            continue;
        }

        if (inside_code_block) {
            continue;
        }

        if (trim_whitespace(line).empty()) {
            block_start = true;
            continue;
        }

        if (block_start && is_headline(line) && !line.starts_with("##")) {
            std::string title = clean_title(line.substr(1));

            if (title.empty()) {
                return std::nullopt;
            }

            return title;
        }

        // Headlines and rules are single line blocks
        block_start = is_headline(line) || is_horizontal_line(line);
    }

    return std::nullopt;
}



// "my-first_post.md" -> "my first post"
std::string mdblog::fallback_title(const std::filesystem::path &file_name) {
    std::string title = file_name.stem().string();

    for (auto &c : title) {
        if (c == '-' || c == '_') {
            c = ' ';
        }
    }

    std::string_view trimmed = trim_whitespace(title);

    if (trimmed.empty()) {
        return file_name.filename().string();
    }

    return std::string(trimmed);
}
