#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <inja/inja.hpp>
#include <RUtils/ErrorOr.hpp>

#include "site.hpp"



namespace mdblog {
    // Built-in templates, used when no template file is configured.
    std::string_view default_page_template();
    std::string_view default_index_template();

    // Page template variables: css, title, content.
    // Index template variables: pages (list of {title, url}).
    // Both can call escape_html(text).
    class SiteTemplates {
    public:
        SiteTemplates();

        // Parses both templates, empty paths select the built-in ones.
        RUtils::ErrorOr<void> load(const std::filesystem::path &page_template_file, const std::filesystem::path &index_template_file);
        RUtils::ErrorOr<void> load_from_strings(std::string_view page_source, std::string_view index_source);

        RUtils::ErrorOr<std::string> render_page(const StyleAsset &style, const std::string &title, const std::string &content);
        RUtils::ErrorOr<std::string> render_index(const std::vector<PageLink> &pages);

    private:
        inja::Environment env;
        inja::Template page_template;
        inja::Template index_template;
        bool loaded = false;

        // inja::Environment is shared between render workers.
        std::mutex render_mutex;
    };
}
