#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <RUtils/Error.hpp>
#include <RUtils/ErrorOr.hpp>

#include "config.hpp"



namespace mdblog {
    class SiteTemplates;

    using Timestamp = std::chrono::system_clock::time_point;

    // Written last by the index builder, no page may take this name.
    inline constexpr std::string_view index_file_name = "index.html";

    // Produces the ordering key of a source file. Defaults to the filesystem creation time,
    // tests and unusual filesystems can plug in something else.
    using OrderingKey = std::function<RUtils::ErrorOr<Timestamp>(const std::filesystem::path &)>;

    struct SourceDocument {
        std::filesystem::path file_name;            // Base name, eg. "post.md"
        std::filesystem::path source_path;          // Full path used for reading
        Timestamp created_time;                     // Assigned once during discovery
        std::optional<std::string> title;           // Set by the converter
    };

    struct PageLink {
        std::string title;                          // Plain text
        std::string url;                            // base_url + output file name
    };

    struct StyleAsset {
        std::string css;
    };

    struct ConvertedDocument {
        std::string html;                           // Fragment, no <html> or <body>
        std::string title;
        bool title_from_heading = false;            // false when the file name fallback was used
    };

    // Everything a single document needs to be rendered, shared read only between workers.
    struct RenderContext {
        const SiteConfig &config;
        const StyleAsset &style;
        SiteTemplates &templates;
    };

    enum class DocumentOutcome : std::uint8_t {
        rendered,
        skipped,        // Soft failure, already reported.
        failed,         // Fatal, aborts the run.
    };

    struct DocumentResult {
        DocumentOutcome outcome = DocumentOutcome::skipped;
        std::optional<PageLink> link;
        std::optional<RUtils::Error> error;
    };

    enum class PipelineState : std::uint8_t {
        init,
        style_loaded,
        sources_discovered,
        pages_rendered,
        index_rendered,
        done,
        failed,
    };

    const char* to_string(PipelineState state);

    struct RunSummary {
        PipelineState state = PipelineState::init;
        std::size_t documents_found = 0;
        std::size_t documents_skipped = 0;
        std::vector<PageLink> pages;
        std::filesystem::path index_file;
    };



    // Style loader
    RUtils::ErrorOr<StyleAsset> load_style_asset(const std::filesystem::path &css_source);

    // Source collector
    RUtils::ErrorOr<Timestamp> filesystem_creation_time(const std::filesystem::path &file);
    RUtils::ErrorOr<std::vector<SourceDocument>> collect_source_documents(const std::filesystem::path &directory, const OrderingKey &ordering_key = filesystem_creation_time);

    // Document converter
    std::string convert_markdown_to_html(std::string_view markdown);
    std::optional<std::string> extract_title(std::string_view markdown);
    std::string fallback_title(const std::filesystem::path &file_name);
    ConvertedDocument convert_document(std::string_view markdown, const std::filesystem::path &file_name);

    // Page renderer
    DocumentResult render_document(SourceDocument &document, const RenderContext &context);
    std::vector<DocumentResult> render_documents(std::vector<SourceDocument> &documents, const RenderContext &context);

    // Turns per document results into the ordered link list, or the first fatal error.
    RUtils::ErrorOr<std::vector<PageLink>> collect_page_links(const std::vector<DocumentResult> &results);

    // Index builder
    RUtils::ErrorOr<std::filesystem::path> build_index(const std::vector<PageLink> &pages, SiteTemplates &templates, const std::filesystem::path &output_dir);

    // Whole run
    RUtils::ErrorOr<RunSummary> run_pipeline(const SiteConfig &config, const OrderingKey &ordering_key = filesystem_creation_time);
}
