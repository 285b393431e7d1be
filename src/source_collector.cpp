#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>

#include "site.hpp"
#include "utils.hpp"

#ifdef PLATFORM_LINUX
    #include <fcntl.h>      // AT_FDCWD
    #include <sys/stat.h>   // statx
#endif

using namespace RUtils;



#ifdef PLATFORM_LINUX
static mdblog::Timestamp to_timestamp(const struct statx_timestamp &ts) {
    auto since_epoch = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    return mdblog::Timestamp(std::chrono::duration_cast<mdblog::Timestamp::duration>(since_epoch));
}
#endif



// Birth time where the filesystem records one, otherwise the last modification time.
ErrorOr<mdblog::Timestamp> mdblog::filesystem_creation_time(const std::filesystem::path &file) {
    #ifdef PLATFORM_LINUX
    struct statx stx = {};

    if(statx(AT_FDCWD, file.c_str(), AT_STATX_SYNC_AS_STAT, STATX_BTIME | STATX_MTIME, &stx) != 0) {
        return Error(std::format("An error occurred getting the metadata for a markdown source file {}: {}.", file.string(), std::strerror(errno)));
    }

    if(stx.stx_mask & STATX_BTIME) {
        return to_timestamp(stx.stx_btime);
    }

    return to_timestamp(stx.stx_mtime);
    #else
    std::error_code err;
    auto write_time = std::filesystem::last_write_time(file, err);

    if(err) {
        return Error(std::format("An error occurred getting the metadata for a markdown source file {}: {}.", file.string(), err.message()));
    }

    return std::chrono::time_point_cast<Timestamp::duration>(std::chrono::file_clock::to_sys(write_time));
    #endif
}



ErrorOr<std::vector<mdblog::SourceDocument>> mdblog::collect_source_documents(const std::filesystem::path &directory, const OrderingKey &ordering_key) {
    std::error_code err;
    std::filesystem::directory_iterator it(directory, err);

    if(err) {
        return Error(std::format("The path to markdown sources dir ({}) is invalid: {}.", directory.string(), err.message()), ErrorType::invalid_argument);
    }

    std::vector<SourceDocument> documents;

    for (std::filesystem::directory_iterator end; it != end; it.increment(err)) {
        if(err) {
            break;
        }

        const auto &dir_entry = *it;
        auto file = dir_entry.path();

        if(file.extension() != ".md") {
            continue;
        }

        std::error_code entry_err;
        bool is_file = dir_entry.is_regular_file(entry_err);

        if(entry_err) {
            Error(std::format("Skipping {}: {}.", file.string(), entry_err.message())).print();
            continue;
        }

        // Skip directories named like markdown files
        if(!is_file) {
            continue;
        }

        auto created_time = ordering_key(file);
        if(created_time.is_error()) {
            created_time.error().print();
            continue;
        }

        documents.push_back({
            .file_name = file.filename(),
            .source_path = file,
            .created_time = created_time.value(),
        });
    }

    if(err) {
        return Error(std::format("An error occurred while listing markdown sources dir ({}): {}.", directory.string(), err.message()));
    }

    // File name breaks ties so the order never depends on directory listing order.
    std::sort(documents.begin(), documents.end(), [](const SourceDocument &a, const SourceDocument &b) {
        if(a.created_time != b.created_time) {
            return a.created_time < b.created_time;
        }
        return a.file_name < b.file_name;
    });

    std::printf("Found %zu markdown files in %s\n", documents.size(), directory.string().c_str());

    return documents;
}
