#include "utils.hpp"

#include <cerrno>
#include <cstring>          // strerror
#include <format>
#include <fstream>
#include <sstream>

using namespace RUtils;



ErrorOr<std::string> mdblog::utils::read_text_file(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);

    if(!in.is_open()) {
        return Error(std::format("Failed to open \"{}\" for reading: {}.", file.string(), std::strerror(errno)), ErrorType::invalid_argument);
    }

    std::ostringstream content;
    content << in.rdbuf();

    if(in.bad()) {
        return Error(std::format("Failed to read \"{}\".", file.string()));
    }

    return content.str();
}



ErrorOr<void> mdblog::utils::write_file_atomically(const std::filesystem::path& target, std::string_view content) {
    std::filesystem::path temp_file = target.parent_path() / ("." + target.filename().string() + ".tmp");

    {
        std::ofstream out(temp_file, std::ios::binary | std::ios::trunc);

        if(!out.is_open()) {
            return Error(std::format("Failed to open \"{}\" for writing: {}.", temp_file.string(), std::strerror(errno)));
        }

        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();

        if(!out) {
            out.close();
            std::error_code ignored;
            std::filesystem::remove(temp_file, ignored);
            return Error(std::format("Failed to write \"{}\".", temp_file.string()));
        }
    }

    std::error_code err;
    std::filesystem::rename(temp_file, target, err);

    if(err) {
        std::error_code ignored;
        std::filesystem::remove(temp_file, ignored);
        return Error(std::format("Failed to move rendered file into place at \"{}\": {}.", target.string(), err.message()));
    }

    return {};
}



std::filesystem::path mdblog::utils::output_file_name(const std::filesystem::path& source_file_name) {
    return std::filesystem::path(source_file_name).replace_extension(".html");
}
