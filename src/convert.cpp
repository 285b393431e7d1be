#include <cstdio>
#include <format>
#include <utility>

#include <RUtils/ForEach.hpp>

#include "site.hpp"
#include "templates.hpp"
#include "utils.hpp"

using namespace RUtils;



static mdblog::DocumentResult skipped(Error error) {
    error.print();
    return {.outcome = mdblog::DocumentOutcome::skipped, .error = std::move(error)};
}

static mdblog::DocumentResult failed(Error error) {
    return {.outcome = mdblog::DocumentOutcome::failed, .error = std::move(error)};
}



mdblog::DocumentResult mdblog::render_document(SourceDocument &document, const RenderContext &context) {
    auto out_file_name = utils::output_file_name(document.file_name);

    if(out_file_name.string() == index_file_name) {
        return skipped(Error(std::format("{} would be rendered to {} and replaced by the index, skipping it.", document.file_name.string(), index_file_name)));
    }

    auto markdown = utils::read_text_file(document.source_path);
    if(markdown.is_error()) {
        return skipped(markdown.error());
    }

    auto converted = convert_document(markdown.value(), document.file_name);
    document.title = converted.title;

    if(!converted.title_from_heading) {
        Error(std::format("{} has no level 1 heading, using \"{}\" as its title.", document.file_name.string(), converted.title)).print();
    }

    std::printf("Entry title: %s\n", converted.title.c_str());

    // A template that can't render one page can't render any of them.
    auto page = context.templates.render_page(context.style, converted.title, converted.html);
    if(page.is_error()) {
        return failed(page.error());
    }

    auto out_path = context.config.rendered_outputs / out_file_name;

    auto written = utils::write_file_atomically(out_path, page.value());
    if(written.is_error()) {
        std::printf("error writing rendered file %s, it won't be listed in the index\n", out_path.string().c_str());
        return skipped(written.error());
    }

    std::printf("wrote %s\n", out_path.string().c_str());

    return {
        .outcome = DocumentOutcome::rendered,
        .link = PageLink{
            .title = converted.title,
            .url = context.config.base_url + out_file_name.string(),
        },
    };
}



std::vector<mdblog::DocumentResult> mdblog::render_documents(std::vector<SourceDocument> &documents, const RenderContext &context) {
    struct DocumentJob {
        SourceDocument *document;
        DocumentResult result;
    };

    // Every job owns one slot, results come back in source order whatever order workers finish in.
    std::vector<DocumentJob> jobs;
    jobs.reserve(documents.size());

    for (auto &document : documents) {
        jobs.push_back({.document = &document});
    }

    RUtils::for_each_threaded(jobs.begin(), jobs.end(), [&](auto &job) {
        job.result = render_document(*job.document, context);
    }, context.config.max_jobs);

    std::vector<DocumentResult> results;
    results.reserve(jobs.size());

    for (auto &job : jobs) {
        results.push_back(std::move(job.result));
    }

    return results;
}



ErrorOr<std::vector<mdblog::PageLink>> mdblog::collect_page_links(const std::vector<DocumentResult> &results) {
    std::vector<PageLink> pages;

    for (auto &&result : results) {
        switch (result.outcome) {
        case DocumentOutcome::rendered:
            pages.push_back(*result.link);
            continue;

        case DocumentOutcome::skipped:
            continue;

        case DocumentOutcome::failed:
            return *result.error;
        }

        RUtils::Error::unreachable();
    }

    return pages;
}
