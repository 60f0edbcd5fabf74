#include "AtomicFile.hpp"
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

static std::atomic<unsigned> tempCounter{0};

std::string tempPathFor(const std::string& finalPath) {
    fs::path p(finalPath);
    std::string name = "." + p.stem().string() + ".tmp" + std::to_string(getpid()) + "_" +
                       std::to_string(tempCounter++) + p.extension().string();
    return (p.parent_path() / name).string();
}

static bool syncFile(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return false;
    int r = fsync(fd);
    close(fd);
    return r == 0;
}

bool promoteFile(const std::string& tmpPath, const std::string& finalPath,
                 uint64_t minBytes, std::string& error) {
    struct stat st;
    if (stat(tmpPath.c_str(), &st) != 0) {
        error = "output missing";
        return false;
    }
    if ((uint64_t)st.st_size < minBytes) {
        error = "output too small (" + std::to_string(st.st_size) + " bytes)";
        unlink(tmpPath.c_str());
        return false;
    }
    if (!syncFile(tmpPath)) {
        error = std::string("fsync failed: ") + strerror(errno);
        unlink(tmpPath.c_str());
        return false;
    }
    if (rename(tmpPath.c_str(), finalPath.c_str()) != 0) {
        error = std::string("rename failed: ") + strerror(errno);
        unlink(tmpPath.c_str());
        return false;
    }
    return true;
}

bool writeFileAtomic(const std::string& finalPath, const void* data, size_t len,
                     uint64_t minBytes, std::string& error) {
    std::string tmp = tempPathFor(finalPath);
    FILE* f = fopen(tmp.c_str(), "wb");
    if (!f) {
        error = std::string("open failed: ") + strerror(errno);
        return false;
    }
    size_t written = len ? fwrite(data, 1, len, f) : 0;
    bool ok = (written == len) && fflush(f) == 0;
    fclose(f);
    if (!ok) {
        error = "short write";
        unlink(tmp.c_str());
        return false;
    }
    return promoteFile(tmp, finalPath, minBytes, error);
}

bool writeFileAtomic(const std::string& finalPath, const std::string& content) {
    std::string error;
    return writeFileAtomic(finalPath, content.data(), content.size(), 0, error);
}
