#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>



namespace mdblog {
    struct Footnote {
        std::string label;          // Text between "[^" and "]"
        std::string text;           // Markdown body of the definition
        std::size_t number = 0;     // Display number, in order of first reference
        bool referenced = false;
    };

    // Runs maddy on a markdown snippet.
    std::string render_markdown_block(std::string_view markdown);

    // maddy has its own table syntax, GFM pipe tables are rewritten into "|table>" blocks before parsing.
    std::string convert_gfm_tables(std::string_view markdown);

    // Removes "[^label]: text" definitions and replaces "[^label]" references with superscript links.
    std::string extract_footnotes(std::string_view markdown, std::vector<Footnote> &footnotes);
    std::string render_footnote_definitions(const std::vector<Footnote> &footnotes);

    // Typographic quotes, en/em dashes and ellipses.
    std::string apply_smart_punctuation(std::string_view text);
    // Same as above but only touches text outside of tags, code, pre, script and style elements.
    void apply_smart_punctuation_to_html(std::string &html);
}
