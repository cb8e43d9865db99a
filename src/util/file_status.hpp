#pragma once

#include <string>

namespace sidediff {

enum class FileStatus {
    kOk,
    kNullPath,
    kFileDoesNotExist,
    kFileNotReadable,
    kNoPermission,
};

// Empty paths and /dev/null are null paths; they read as an empty source.
FileStatus
check_file_status(const std::string& path);

std::string
to_string(FileStatus status);

inline bool
is_usable(FileStatus status) {
    return status == FileStatus::kOk || status == FileStatus::kNullPath;
}

bool
load_source(const std::string& path, std::string& text);

}  // namespace sidediff
