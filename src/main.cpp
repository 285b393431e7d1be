#include <cstdio>
#include <cstdlib>
#include <filesystem>

#include "RUtils/CommandLine.hpp"

#include "config.hpp"
#include "site.hpp"



int main(int argc, const char *argv[]) {
    // Disable stdout and stderr buffering.
    std::setbuf(stdout, nullptr);
    std::setbuf(stderr, nullptr);

    mdblog::SiteConfig config;

    RUtils::CommandLine cmd = {
        .program_name = "mdblog",
        .arg_definitions = {
            {
                'h',
                "help",
                [&]() {
                    cmd.display_help_string();
                    exit(0);
                },
                nullptr,
                "Display this help message.",
            },
            {
                'v',
                "version",
                [&]() {
                    std::printf("mdblog v" MDBLOG_VERSION "\n\n");
                    exit(0);
                },
                nullptr,
                "Display version information.",
            },
            {
                'c',
                "css-source",
                [&](std::string param) {
                    config.css_source = param;
                },
                "file",
                "Path to the CSS source file. (required)",
            },
            {
                'm',
                "md-sources",
                [&](std::string param) {
                    config.md_sources = param;
                },
                "directory",
                "Path to the dir containing the markdown files. (required)",
            },
            {
                'r',
                "rendered-outputs",
                [&](std::string param) {
                    config.rendered_outputs = param;
                },
                "directory",
                "Path to the dir into which the rendered files will be written. (required)",
            },
            {
                'b',
                "base-url",
                [&](std::string param) {
                    config.base_url = param;
                },
                "url",
                "Prefix of page links in index.html. (default: \"./\")",
            },
            {
                0,
                "page-template",
                [&](std::string param) {
                    config.page_template = param;
                },
                "file",
                "Use an inja template for pages instead of the built-in one.",
            },
            {
                0,
                "index-template",
                [&](std::string param) {
                    config.index_template = param;
                },
                "file",
                "Use an inja template for index.html instead of the built-in one.",
            },
            {
                'j',
                "jobs",
                [&](std::string param) {
                    if(std::sscanf(param.c_str(), "%u", &config.max_jobs) != 1) {
                        std::printf("-j --jobs: expected a positive number or 0 but got: \"%s\". Ignored...\n", param.c_str());
                    }
                },
                "amount",
                "Max nuber of threads to use during rendering. (default: number of threads)",
            },
        },
    };

    if(!cmd.parse(argc, argv)) {
        cmd.display_help_string();
        return 1;
    }

    if(config.css_source.empty() || config.md_sources.empty() || config.rendered_outputs.empty()) {
        std::fprintf(stderr, "Missing required argument, --css-source, --md-sources and --rendered-outputs have to be provided.\n");
        cmd.display_help_string();
        return 1;
    }

    auto summary = mdblog::run_pipeline(config);

    if(summary.is_error()) {
        summary.error().print();
        std::fprintf(stderr, "mdblog: site generation failed.\n");
        return 1;
    }

    std::printf("Rendered %zu of %zu pages, %zu skipped.\n", summary.value().pages.size(), summary.value().documents_found, summary.value().documents_skipped);

    return 0;
}
