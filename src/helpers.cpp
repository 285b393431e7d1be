#include <array>
#include <cctype>
#include <utility>

#include "helpers.hpp"



std::string remove_html_tags(std::string_view in) {
    bool tag = false;

    std::string out;

    out.reserve(in.size());

    for (auto& c : in) {
        if (c == '<') {
            tag = true;
            continue;
        }
        if (c == '>' && tag) {
            tag = false;
            continue;
        }
        if (!tag) {
            out += c;
        }
    }

    return out;
}

std::string_view trim_whitespace(std::string_view in) {
    size_t start = in.size(), end = in.size();

    for (size_t i = 0; i < in.size(); i++) {
        auto c = static_cast<unsigned char>(in[i]);

        if (!std::isspace(c)) {
            start = i;
            break;
        }
    }

    for (size_t i = in.size(); i > start; i--) {
        auto c = static_cast<unsigned char>(in[i - 1]);

        if (!std::isspace(c)) {
            end = i;
            break;
        }
    }

    return in.substr(start, end - start);
}



std::string escape_html(std::string_view in) {
    std::string out;

    out.reserve(in.size());

    for (auto c : in) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\'':
            out += "&#39;";
            break;
        default:
            out += c;
            break;
        }
    }

    return out;
}

std::string decode_html_entities(std::string_view in) {
    static constexpr std::array<std::pair<std::string_view, char>, 6> entities = {{
        {"&amp;", '&'},
        {"&lt;", '<'},
        {"&gt;", '>'},
        {"&quot;", '"'},
        {"&#39;", '\''},
        {"&#124;", '|'},
    }};

    std::string out;

    out.reserve(in.size());

    for (size_t i = 0; i < in.size(); i++) {
        bool decoded = false;

        if (in[i] == '&') {
            for (auto &&[entity, c] : entities) {
                if (in.substr(i, entity.size()) == entity) {
                    out += c;
                    i += entity.size() - 1;
                    decoded = true;
                    break;
                }
            }
        }

        if (!decoded) {
            out += in[i];
        }
    }

    return out;
}



std::string normalize_line_endings(std::string_view in) {
    std::string out;

    out.reserve(in.size());

    for (size_t i = 0; i < in.size(); i++) {
        if (in[i] == '\r') {
            out += '\n';
            if (i + 1 < in.size() && in[i + 1] == '\n') {
                i++;
            }
            continue;
        }
        out += in[i];
    }

    return out;
}

std::vector<std::string_view> split_lines(std::string_view in) {
    std::vector<std::string_view> lines;

    size_t start = 0;
    while (start < in.size()) {
        size_t end = in.find('\n', start);

        if (end == std::string_view::npos) {
            lines.push_back(in.substr(start));
            break;
        }

        lines.push_back(in.substr(start, end - start));
        start = end + 1;
    }

    return lines;
}



bool is_code_fence(std::string_view line) {
    return line.starts_with("```");
}
