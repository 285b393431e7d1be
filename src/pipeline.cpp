#include <cstdio>

#include "site.hpp"
#include "templates.hpp"

using namespace RUtils;



const char* mdblog::to_string(PipelineState state) {
    switch (state) {
    case PipelineState::init:                return "init";
    case PipelineState::style_loaded:        return "style loaded";
    case PipelineState::sources_discovered:  return "sources discovered";
    case PipelineState::pages_rendered:      return "pages rendered";
    case PipelineState::index_rendered:      return "index rendered";
    case PipelineState::done:                return "done";
    case PipelineState::failed:              return "failed";
    }

    RUtils::Error::unreachable();
    return "";
}



// Init -> StyleLoaded -> SourcesDiscovered -> PagesRendered -> IndexRendered -> Done
// Any error returned from here is fatal, per document problems never leave render_documents().
ErrorOr<mdblog::RunSummary> mdblog::run_pipeline(const SiteConfig &config, const OrderingKey &ordering_key) {
    RunSummary summary;

    auto fail = [&](Error error) -> Error {
        std::printf("Site generation failed after stage: %s\n", to_string(summary.state));
        summary.state = PipelineState::failed;
        return error;
    };

    if(auto valid = validate_config(config); valid.is_error()) {
        return fail(valid.error());
    }

    // Templates are checked up front, a broken one would fail on the first page anyway.
    SiteTemplates templates;
    if(auto loaded = templates.load(config.page_template, config.index_template); loaded.is_error()) {
        return fail(loaded.error());
    }

    auto style = load_style_asset(config.css_source);
    if(style.is_error()) {
        return fail(style.error());
    }
    summary.state = PipelineState::style_loaded;

    auto documents = collect_source_documents(config.md_sources, ordering_key);
    if(documents.is_error()) {
        return fail(documents.error());
    }
    summary.state = PipelineState::sources_discovered;

    std::vector<SourceDocument> sources = documents.value();
    summary.documents_found = sources.size();

    StyleAsset style_asset = style.value();
    RenderContext context{
        .config = config,
        .style = style_asset,
        .templates = templates,
    };

    auto results = render_documents(sources, context);

    auto pages = collect_page_links(results);
    if(pages.is_error()) {
        return fail(pages.error());
    }
    summary.state = PipelineState::pages_rendered;
    summary.pages = pages.value();
    summary.documents_skipped = summary.documents_found - summary.pages.size();

    auto index_file = build_index(summary.pages, templates, config.rendered_outputs);
    if(index_file.is_error()) {
        return fail(index_file.error());
    }
    summary.state = PipelineState::index_rendered;
    summary.index_file = index_file.value();

    summary.state = PipelineState::done;
    return summary;
}
