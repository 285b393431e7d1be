#include <algorithm>
#include <format>
#include <regex>

#include "markdown_extensions.hpp"
#include "helpers.hpp"



static bool is_table_delimiter_row(std::string_view line) {
    static const std::regex delimiter_test("^\\s*\\|?\\s*:?-+:?\\s*(\\|\\s*:?-+:?\\s*)*\\|?\\s*$");

    if(line.find('|') == std::string_view::npos) {
        return false;
    }

    return std::regex_match(line.begin(), line.end(), delimiter_test);
}

static std::vector<std::string> split_table_row(std::string_view line) {
    std::string_view row = trim_whitespace(line);

    if(row.starts_with('|')) {
        row.remove_prefix(1);
    }
    if(row.ends_with('|') && !row.ends_with("\\|")) {
        row.remove_suffix(1);
    }

    std::vector<std::string> cells;
    std::string cell;

    for (size_t i = 0; i < row.size(); i++) {
        // maddy splits on every pipe, escaped ones have to become an entity
        if(row[i] == '\\' && i + 1 < row.size() && row[i + 1] == '|') {
            cell += "&#124;";
            i++;
            continue;
        }

        if(row[i] == '|') {
            cells.emplace_back(trim_whitespace(cell));
            cell.clear();
            continue;
        }

        cell += row[i];
    }

    cells.emplace_back(trim_whitespace(cell));

    return cells;
}

static std::string join_table_row(std::vector<std::string> cells, size_t columns) {
    cells.resize(columns);

    std::string out;
    for (size_t i = 0; i < cells.size(); i++) {
        if(i > 0) {
            out += '|';
        }
        out += cells[i];
    }

    return out;
}



std::string mdblog::convert_gfm_tables(std::string_view markdown) {
    auto lines = split_lines(markdown);

    std::string out;
    out.reserve(markdown.size());

    bool inside_code_block = false;

    for (size_t i = 0; i < lines.size(); i++) {
        auto line = lines[i];

        if(is_code_fence(line)) {
            inside_code_block = !inside_code_block;
        }

        bool table_start = !inside_code_block
            && line.find('|') != std::string_view::npos
            && i + 1 < lines.size()
            && is_table_delimiter_row(lines[i + 1]);

        if(table_start) {
            auto header = split_table_row(line);
            auto delimiter = split_table_row(lines[i + 1]);

            if(header.size() != delimiter.size()) {
                table_start = false;
            }
        }

        if(!table_start) {
            out += line;
            out += '\n';
            continue;
        }

        size_t columns = split_table_row(line).size();

        out += "\n|table>\n";
        out += join_table_row(split_table_row(line), columns);
        out += '\n';

        for (size_t c = 0; c < columns; c++) {
            out += c == 0 ? "-" : " | -";
        }
        out += '\n';

        // Body ends on the first line that can't be a row.
        i += 2;
        for (; i < lines.size(); i++) {
            auto row = lines[i];
            if(trim_whitespace(row).empty() || row.find('|') == std::string_view::npos || is_code_fence(row)) {
                break;
            }
            out += join_table_row(split_table_row(row), columns);
            out += '\n';
        }
        i--;

        out += "|<table\n\n";
    }

    return out;
}



std::string mdblog::extract_footnotes(std::string_view markdown, std::vector<Footnote> &footnotes) {
    static const std::regex definition_test("^\\[\\^([^\\]\\s]+)\\]:[ \\t]?(.*)$");
    static const std::regex reference_test("\\[\\^([^\\]\\s]+)\\]");

    auto lines = split_lines(markdown);

    // Pass 1: pull definitions out of the text.
    std::vector<std::string_view> body;
    bool inside_code_block = false;

    for (size_t i = 0; i < lines.size(); i++) {
        auto line = lines[i];

        if(is_code_fence(line)) {
            inside_code_block = !inside_code_block;
        }

        std::match_results<std::string_view::const_iterator> match;
        if(inside_code_block || !std::regex_match(line.begin(), line.end(), match, definition_test)) {
            body.push_back(line);
            continue;
        }

        Footnote footnote{.label = match[1].str(), .text = match[2].str()};

        // Indented lines continue the definition
        while (i + 1 < lines.size() && (lines[i + 1].starts_with("    ") || lines[i + 1].starts_with('\t'))) {
            i++;
            footnote.text += '\n';
            footnote.text += trim_whitespace(lines[i]);
        }

        // First definition wins
        bool duplicate = std::any_of(footnotes.begin(), footnotes.end(), [&](const Footnote &f) { return f.label == footnote.label; });
        if(!duplicate) {
            footnotes.push_back(std::move(footnote));
        }
    }

    // Pass 2: replace references, code spans and blocks are left alone.
    std::string out;
    out.reserve(markdown.size());

    size_t next_number = 1;
    inside_code_block = false;

    for (auto line : body) {
        if(is_code_fence(line)) {
            inside_code_block = !inside_code_block;
        }

        if(inside_code_block || footnotes.empty()) {
            out += line;
            out += '\n';
            continue;
        }

        bool inside_code_span = false;
        size_t i = 0;

        while (i < line.size()) {
            if(line[i] == '`') {
                inside_code_span = !inside_code_span;
                out += line[i++];
                continue;
            }

            std::match_results<std::string_view::const_iterator> match;
            auto rest = line.substr(i);

            if(inside_code_span || !rest.starts_with("[^") || !std::regex_search(rest.begin(), rest.end(), match, reference_test, std::regex_constants::match_continuous)) {
                out += line[i++];
                continue;
            }

            auto footnote = std::find_if(footnotes.begin(), footnotes.end(), [&](const Footnote &f) { return f.label == match[1].str(); });

            // Undefined references stay as they are
            if(footnote == footnotes.end()) {
                out += line[i++];
                continue;
            }

            if(!footnote->referenced) {
                footnote->referenced = true;
                footnote->number = next_number++;
            }

            out += std::format("<sup class=\"footnote-reference\"><a href=\"#fn-{0}\">{0}</a></sup>", footnote->number);
            i += match.length(0);
        }

        out += '\n';
    }

    // Unreferenced definitions are still rendered, after the referenced ones.
    for (auto &footnote : footnotes) {
        if(!footnote.referenced) {
            footnote.number = next_number++;
        }
    }

    std::sort(footnotes.begin(), footnotes.end(), [](const Footnote &a, const Footnote &b) {
        return a.number < b.number;
    });

    return out;
}



std::string mdblog::render_footnote_definitions(const std::vector<Footnote> &footnotes) {
    std::string out;

    for (auto &&footnote : footnotes) {
        out += std::format("<div class=\"footnote-definition\" id=\"fn-{0}\"><sup class=\"footnote-definition-label\">{0}</sup>", footnote.number);
        out += render_markdown_block(footnote.text);
        out += "</div>";
    }

    return out;
}
