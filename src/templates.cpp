#include <format>

#include <nlohmann/json.hpp>

#include "templates.hpp"
#include "helpers.hpp"
#include "utils.hpp"

using namespace RUtils;



namespace mdblog {
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PageLink, title, url)
}



std::string_view mdblog::default_page_template() {
    return R"###(<!doctype html>
<html>
<head>
<meta charset="utf-8">
<title>{{ escape_html(title) }}</title>
<style>{{ css }}

img {
    max-width: 200px;
}

</style>
</head>

<body>
{{ content }}
</body>

</html>
)###";
}

std::string_view mdblog::default_index_template() {
    return R"###(<!doctype html>
<html>
<head>
<meta charset="utf-8">
<style>
    html, body {
        display: flex;
        align-items: center;
        justify-content: center;
        height: 100%;
        background-color: #222;
        min-height: 100%;
    }

    .body {
        color: #fafafa;
    }

    .container {
        display: flex;
        justify-content: center;
        align-items: center;
        align-content: center;
        flex-direction: column;
        min-width: 500px;
        height: 80%;
        margin: 0;
        min-height: 80%;
    }

    .row-item {
        display: flex;
        position: relative;
        width: 100%;
        padding: 5px;
        align-items: center;
        justify-content: center;
    }

    a {
        text-decoration: none;
    }

    a, a:visited, a:hover, a:active {
        color: #fafafa;
    }

    a:hover {
        font-weight: bold;
    }
</style>
</head>

<body>
<div class="container">
{% for page in pages %}
    <div class="row-item"><a href="{{ escape_html(page.url) }}">{{ escape_html(page.title) }}</a></div>
{% endfor %}
</div>
</body>
</html>
)###";
}



mdblog::SiteTemplates::SiteTemplates() {
    env.set_trim_blocks(true);
    env.set_lstrip_blocks(true);

    env.add_callback("escape_html", 1, [](inja::Arguments &args) {
        return escape_html(args.at(0)->get<std::string>());
    });
}



ErrorOr<void> mdblog::SiteTemplates::load(const std::filesystem::path &page_template_file, const std::filesystem::path &index_template_file) {
    std::string page_source(default_page_template());
    std::string index_source(default_index_template());

    if(!page_template_file.empty()) {
        auto source = utils::read_text_file(page_template_file);
        if(source.is_error()) {
            return source.error();
        }
        page_source = source.value();
    }

    if(!index_template_file.empty()) {
        auto source = utils::read_text_file(index_template_file);
        if(source.is_error()) {
            return source.error();
        }
        index_source = source.value();
    }

    return load_from_strings(page_source, index_source);
}



ErrorOr<void> mdblog::SiteTemplates::load_from_strings(std::string_view page_source, std::string_view index_source) {
    std::scoped_lock lock(render_mutex);

    try {
        page_template = env.parse(page_source);
    } catch (const inja::InjaError &e) {
        return Error(std::format("An error occurred while attempting to add a (page) template: {}", e.what()), ErrorType::invalid_argument);
    }

    try {
        index_template = env.parse(index_source);
    } catch (const inja::InjaError &e) {
        return Error(std::format("An error occurred while attempting to add a (index) template: {}", e.what()), ErrorType::invalid_argument);
    }

    loaded = true;
    return {};
}



ErrorOr<std::string> mdblog::SiteTemplates::render_page(const StyleAsset &style, const std::string &title, const std::string &content) {
    if(!loaded) {
        return Error("Page template used before it was loaded.");
    }

    nlohmann::json data;
    data["css"] = style.css;
    data["title"] = title;
    data["content"] = content;

    std::scoped_lock lock(render_mutex);

    try {
        return env.render(page_template, data);
    } catch (const std::exception &e) {
        return Error(std::format("An error occurred while attempting to use a (page) template: {}", e.what()), ErrorType::library);
    }
}



ErrorOr<std::string> mdblog::SiteTemplates::render_index(const std::vector<PageLink> &pages) {
    if(!loaded) {
        return Error("Index template used before it was loaded.");
    }

    nlohmann::json data;
    data["pages"] = pages;

    std::scoped_lock lock(render_mutex);

    try {
        return env.render(index_template, data);
    } catch (const std::exception &e) {
        return Error(std::format("An error occurred while attempting to use a (index) template: {}", e.what()), ErrorType::library);
    }
}
