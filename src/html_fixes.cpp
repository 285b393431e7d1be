#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <string>
#include <utility>

#include "markdown_extensions.hpp"



namespace {
    // Keeps the quote context between calls so text split by inline tags is handled as one run.
    struct SmartPunctuation {
        char prev = '\0';

        bool opens_quote() const {
            return prev == '\0' || std::isspace(static_cast<unsigned char>(prev)) || std::strchr("([{-", prev) != nullptr;
        }

        void feed(std::string_view text, std::string &out) {
            for (size_t i = 0; i < text.size(); i++) {
                char c = text[i];

                if (c == '-' && i + 1 < text.size() && text[i + 1] == '-') {
                    if (i + 2 < text.size() && text[i + 2] == '-') {
                        out += "—";
                        i += 2;
                    } else {
                        out += "–";
                        i += 1;
                    }
                    prev = '-';
                    continue;
                }

                if (c == '.' && text.substr(i, 3) == "...") {
                    out += "…";
                    i += 2;
                    prev = '.';
                    continue;
                }

                if (c == '"') {
                    bool opening = opens_quote();
                    out += opening ? "“" : "”";
                    prev = opening ? '(' : 'a';
                    continue;
                }

                if (c == '\'') {
                    bool opening = opens_quote();
                    out += opening ? "‘" : "’";
                    prev = opening ? '(' : 'a';
                    continue;
                }

                out += c;
                prev = c;
            }
        }
    };

    // Contents of these are never touched.
    constexpr std::array<std::string_view, 5> verbatim_elements = {"code", "pre", "script", "style", "kbd"};

    // Quote context continues through these, any other tag starts a new run.
    constexpr std::array<std::string_view, 13> inline_elements = {"a", "b", "i", "em", "strong", "s", "del", "sup", "sub", "span", "u", "mark", "small"};

    std::string tag_name(std::string_view tag, bool &closing) {
        size_t i = 1;   // skip '<'
        closing = false;

        if (i < tag.size() && tag[i] == '/') {
            closing = true;
            i++;
        }

        std::string name;
        for (; i < tag.size() && std::isalnum(static_cast<unsigned char>(tag[i])); i++) {
            name += static_cast<char>(std::tolower(static_cast<unsigned char>(tag[i])));
        }

        return name;
    }
}



std::string mdblog::apply_smart_punctuation(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    SmartPunctuation smart;
    smart.feed(text, out);

    return out;
}



void mdblog::apply_smart_punctuation_to_html(std::string &html) {
    std::string out;
    out.reserve(html.size());

    SmartPunctuation smart;
    int verbatim_depth = 0;
    size_t i = 0;

    while (i < html.size()) {
        size_t tag_open = html.find('<', i);

        // Text up to the next tag
        std::string_view text = std::string_view(html).substr(i, tag_open == std::string::npos ? std::string::npos : tag_open - i);
        if (verbatim_depth > 0) {
            out += text;
        } else {
            smart.feed(text, out);
        }

        if (tag_open == std::string::npos) {
            break;
        }

        size_t tag_close = html.find('>', tag_open);
        if (tag_close == std::string::npos) {
            // Stray '<', keep the rest verbatim
            out += std::string_view(html).substr(tag_open);
            break;
        }

        std::string_view tag = std::string_view(html).substr(tag_open, tag_close - tag_open + 1);
        out += tag;
        i = tag_close + 1;

        bool closing;
        std::string name = tag_name(tag, closing);

        if (std::find(verbatim_elements.begin(), verbatim_elements.end(), name) != verbatim_elements.end()) {
            verbatim_depth += closing ? -1 : 1;
            verbatim_depth = std::max(verbatim_depth, 0);
            continue;
        }

        if (std::find(inline_elements.begin(), inline_elements.end(), name) == inline_elements.end()) {
            smart.prev = '\0';
        }
    }

    html = std::move(out);
}
