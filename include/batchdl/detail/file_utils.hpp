#pragma once

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

namespace batchdl::detail {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

// Opens `path` for writing, emptying it when `truncate` is set and appending otherwise.
FilePtr openForWrite(const std::filesystem::path& path, bool truncate, std::string& error);

// Truncates the file to zero bytes if it exists.
bool discardPartial(const std::filesystem::path& path, std::error_code& ec);

bool setModificationTime(const std::filesystem::path& path, std::time_t mtime, std::error_code& ec);

} // namespace batchdl::detail
