#include <sstream>

#include <maddy/parser.h>

#include "site.hpp"
#include "markdown_extensions.hpp"
#include "helpers.hpp"



std::string mdblog::render_markdown_block(std::string_view markdown) {
    // maddy parsers keep state while parsing, one per call keeps workers independent.
    maddy::Parser parser;
    std::istringstream md_stream{std::string(markdown)};
    return parser.Parse(md_stream);
}



// maddy handles headings, lists, emphasis, links, images, code, strikethrough and checklists,
// tables, footnotes and smart punctuation are layered on top of it.
std::string mdblog::convert_markdown_to_html(std::string_view markdown) {
    std::string normalized = normalize_line_endings(markdown);

    std::vector<Footnote> footnotes;
    std::string prepared = convert_gfm_tables(extract_footnotes(normalized, footnotes));

    std::string html = render_markdown_block(prepared);
    html += render_footnote_definitions(footnotes);

    apply_smart_punctuation_to_html(html);

    return html;
}



mdblog::ConvertedDocument mdblog::convert_document(std::string_view markdown, const std::filesystem::path &file_name) {
    ConvertedDocument converted;
    converted.html = convert_markdown_to_html(markdown);

    if(auto title = extract_title(markdown)) {
        converted.title = *title;
        converted.title_from_heading = true;
    } else {
        converted.title = fallback_title(file_name);
    }

    return converted;
}
