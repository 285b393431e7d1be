#include <format>

#include "config.hpp"

using namespace RUtils;



static bool is_directory(const std::filesystem::path &path, std::string &reason) {
    std::error_code err;
    auto status = std::filesystem::status(path, err);

    if(err) {
        reason = err.message();
        return false;
    }

    if(!std::filesystem::exists(status)) {
        reason = "no such file or directory";
        return false;
    }

    if(!std::filesystem::is_directory(status)) {
        reason = "not a directory";
        return false;
    }

    return true;
}



ErrorOr<void> mdblog::validate_config(const SiteConfig &config) {
    std::error_code err;
    if(!std::filesystem::is_regular_file(config.css_source, err)) {
        return Error(std::format("The path ({}) to css sources is invalid: {}.", config.css_source.string(), err ? err.message() : "not a regular file"), ErrorType::invalid_argument);
    }

    std::string reason;

    if(!is_directory(config.md_sources, reason)) {
        return Error(std::format("The path ({}) to markdown sources dir is invalid: {}.", config.md_sources.string(), reason), ErrorType::invalid_argument);
    }

    if(!is_directory(config.rendered_outputs, reason)) {
        return Error(std::format("The path ({}) to rendered output directory is invalid: {}.", config.rendered_outputs.string(), reason), ErrorType::invalid_argument);
    }

    // Custom templates are optional
    for (auto &&template_path : {config.page_template, config.index_template}) {
        if(!template_path.empty() && !std::filesystem::is_regular_file(template_path, err)) {
            return Error(std::format("The template file ({}) is invalid: {}.", template_path.string(), err ? err.message() : "not a regular file"), ErrorType::invalid_argument);
        }
    }

    return {};
}
