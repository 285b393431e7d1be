#include <cstdio>
#include <format>

#include "site.hpp"
#include "templates.hpp"
#include "utils.hpp"

using namespace RUtils;



// Index has to list every produced page, so unlike pages any failure here is fatal.
ErrorOr<std::filesystem::path> mdblog::build_index(const std::vector<PageLink> &pages, SiteTemplates &templates, const std::filesystem::path &output_dir) {
    auto rendered = templates.render_index(pages);
    if(rendered.is_error()) {
        return rendered.error();
    }

    auto out_file = output_dir / index_file_name;

    auto written = utils::write_file_atomically(out_file, rendered.value());
    if(written.is_error()) {
        return written.error();
    }

    std::printf("wrote %s with %zu links\n", out_file.string().c_str(), pages.size());

    return out_file;
}
