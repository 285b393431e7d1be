#include <format>

#include "site.hpp"
#include "utils.hpp"

using namespace RUtils;



ErrorOr<mdblog::StyleAsset> mdblog::load_style_asset(const std::filesystem::path &css_source) {
    std::error_code err;
    if(!std::filesystem::is_regular_file(css_source, err)) {
        return Error(std::format("The css source file \"{}\" is not a readable file{}.", css_source.string(), err ? ": " + err.message() : ""), ErrorType::invalid_argument);
    }

    auto css = utils::read_text_file(css_source);
    if(css.is_error()) {
        return css.error();
    }

    return StyleAsset{css.value()};
}
