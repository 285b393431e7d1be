#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include <RUtils/ErrorOr.hpp>



#ifndef MDBLOG_VERSION
    #define MDBLOG_VERSION "0.0.0"
#endif

namespace mdblog {
    struct SiteConfig {
        std::filesystem::path css_source;           // Stylesheet inlined into every page
        std::filesystem::path md_sources;           // Directory with .md files, not searched recursively
        std::filesystem::path rendered_outputs;     // Directory receiving pages and index.html

        std::string base_url = "./";                // Prefix of every link in the index

        // Empty path means the built-in template is used.
        std::filesystem::path page_template;
        std::filesystem::path index_template;

        std::uint32_t max_jobs = 0;                 // 0 = one thread per hardware thread
    };

    // Checks that every input and output path exists and has the right type.
    RUtils::ErrorOr<void> validate_config(const SiteConfig &config);
}
