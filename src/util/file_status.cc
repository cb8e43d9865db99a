#include "file_status.hpp"

#include "util/readlines.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

sidediff::FileStatus
sidediff::check_file_status(const std::string& path) {
    if (path.empty() || path == "/dev/null") {
        return FileStatus::kNullPath;
    }

    std::error_code ec;
    fs::path file_path(path);

    if (!fs::exists(file_path, ec)) {
        return FileStatus::kFileDoesNotExist;
    }

    if (!(fs::is_regular_file(file_path, ec) || fs::is_fifo(file_path, ec) || fs::is_character_file(file_path, ec))) {
        return FileStatus::kFileNotReadable;
    }

    auto perms = fs::status(file_path, ec).permissions();
    if (((perms & fs::perms::owner_read) == fs::perms::none) &&
        ((perms & fs::perms::group_read) == fs::perms::none) &&
        ((perms & fs::perms::others_read) == fs::perms::none)) {
        return FileStatus::kNoPermission;
    }

    return FileStatus::kOk;
}

std::string
sidediff::to_string(const FileStatus status) {
    switch (status) {
        case FileStatus::kOk:
            return "Success";
        case FileStatus::kFileDoesNotExist:
            return "File does not exist";
        case FileStatus::kFileNotReadable:
            return "File is not readable (invalid file)";
        case FileStatus::kNoPermission:
            return "File is not readable (no permission)";
        case FileStatus::kNullPath:
            return "Null path";
    }
    return "Unknown error";
}

bool
sidediff::load_source(const std::string& path, std::string& text) {
    if (check_file_status(path) == FileStatus::kNullPath) {
        text.clear();
        return true;
    }
    return sidediff::read_file(path, text);
}
