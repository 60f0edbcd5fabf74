#include "DiskUsage.hpp"
#include <filesystem>
#include <system_error>
#include <sys/statvfs.h>

namespace fs = std::filesystem;

int getDiskUsagePercent(const std::string& path) {
    if (path.empty()) return -1;
    struct statvfs vfs;
    if (statvfs(path.c_str(), &vfs) != 0) return -1;
    unsigned long long total = (unsigned long long)vfs.f_blocks * vfs.f_frsize;
    unsigned long long avail = (unsigned long long)vfs.f_bavail * vfs.f_frsize;
    if (total == 0) return 0;
    return (int)(((total - avail) * 100) / total);
}

uint64_t directorySizeBytes(const std::string& path) {
    uint64_t total = 0;
    std::error_code ec;
    if (!fs::exists(path, ec)) return 0;
    for (fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        std::error_code sizeEc;
        if (it->is_regular_file(sizeEc)) {
            auto sz = it->file_size(sizeEc);
            if (!sizeEc) total += sz;
        }
    }
    return total;
}
