#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <RUtils/ErrorOr.hpp>



// Birth time lookup through statx is Linux only.
#ifdef __linux__
    #define PLATFORM_LINUX
#endif

namespace mdblog::utils {
    // Reads the whole file into memory, bytes are kept as is.
    RUtils::ErrorOr<std::string> read_text_file(const std::filesystem::path& file);

    // Writes content into a hidden sibling file and renames it over target,
    // readers never see a half written page.
    RUtils::ErrorOr<void> write_file_atomically(const std::filesystem::path& target, std::string_view content);

    // "post.md" -> "post.html"
    std::filesystem::path output_file_name(const std::filesystem::path& source_file_name);
}
