#include "batchdl/detail/file_utils.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>

namespace batchdl::detail {

FilePtr openForWrite(const std::filesystem::path& path, bool truncate, std::string& error) {
    FilePtr file{std::fopen(path.c_str(), truncate ? "wb" : "ab")};
    if (!file) {
        error = std::string{"Cannot open destination file: "} + std::strerror(errno);
    }
    return file;
}

bool discardPartial(const std::filesystem::path& path, std::error_code& ec) {
    ec.clear();
    if (!std::filesystem::exists(path, ec)) {
        return !ec;
    }
    std::filesystem::resize_file(path, 0, ec);
    return !ec;
}

bool setModificationTime(const std::filesystem::path& path, std::time_t mtime, std::error_code& ec) {
    ec.clear();
    struct timespec times[2];
    times[0].tv_sec = 0;
    times[0].tv_nsec = UTIME_OMIT;
    times[1].tv_sec = mtime;
    times[1].tv_nsec = 0;
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        ec.assign(errno, std::generic_category());
        return false;
    }
    return true;
}

} // namespace batchdl::detail
