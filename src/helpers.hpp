#pragma once

#include <string>
#include <string_view>
#include <vector>



std::string remove_html_tags(std::string_view in);                 // "<b>a</b>b" -> "ab"
std::string_view trim_whitespace(std::string_view in);
std::string escape_html(std::string_view in);
std::string decode_html_entities(std::string_view in);             // Only the entities escape_html produces
std::string normalize_line_endings(std::string_view in);           // \r\n and \r -> \n
std::vector<std::string_view> split_lines(std::string_view in);

// Lines starting with ``` open and close fenced code blocks.
bool is_code_fence(std::string_view line);
