#include "Retention.hpp"
#include "Segmenter.hpp"
#include "supervisor/Logger.hpp"
#include <algorithm>
#include <filesystem>
#include <sys/stat.h>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

RetentionManager::RetentionManager(std::string recordingsRoot, RecorderSettings settings)
    : root(std::move(recordingsRoot)), cfg(std::move(settings)) {}

void RetentionManager::updateSettings(const RecorderSettings& settings) {
    std::lock_guard<std::mutex> lock(settingsMtx);
    cfg = settings;
}

void RetentionManager::setMedia(const MediaSettings& media) {
    std::lock_guard<std::mutex> lock(settingsMtx);
    mediaRoot = media.root;
    mediaRetentionDays = media.retentionDays;
}

RecorderSettings RetentionManager::settings() const {
    std::lock_guard<std::mutex> lock(settingsMtx);
    return cfg;
}

DiskUsageSample RetentionManager::sample() const {
    return sample(settings());
}

DiskUsageSample RetentionManager::sample(const RecorderSettings& s) const {
    if (usageProbe) return usageProbe();
    DiskUsageSample u;
    u.percent = getDiskUsagePercent(root);
    if (s.maxTotalBytes > 0) u.usedBytes = directorySizeBytes(root);
    return u;
}

bool RetentionManager::overLimit(const DiskUsageSample& usage) const {
    return overLimit(usage, settings());
}

bool RetentionManager::overLimit(const DiskUsageSample& usage, const RecorderSettings& s) {
    if (usage.percent >= 0 && usage.percent >= s.diskLimitPercent) return true;
    return s.maxTotalBytes > 0 && usage.usedBytes >= s.maxTotalBytes;
}

static bool removeSegment(const Segment& s) {
    std::error_code ec;
    if (!fs::remove(s.path, ec) || ec) {
        logWarn("Retention", "cannot delete " + s.path + (ec ? ": " + ec.message() : ""));
        return false;
    }
    return true;
}

bool deleteEventMedia(const std::string& eventDir) {
    static const char* ORDER[] = {"clip.mp4", "preview.gif", "collage.jpg"};
    std::error_code ec;
    for (const char* name : ORDER) {
        fs::path p = fs::path(eventDir) / name;
        if (fs::exists(p, ec) && !fs::remove(p, ec)) {
            logWarn("Retention", "cannot delete " + p.string() + ": " + ec.message());
        }
    }
    // Leftover temporaries go with the directory.
    fs::remove_all(eventDir, ec);
    if (ec) {
        logWarn("Retention", "cannot delete " + eventDir + ": " + ec.message());
        return false;
    }
    return true;
}

static int64_t modifiedMs(const fs::path& p) {
    struct stat st;
    if (stat(p.c_str(), &st) != 0) return -1;
    return (int64_t)st.st_mtim.tv_sec * 1000 + st.st_mtim.tv_nsec / 1000000;
}

struct EventDirEntry {
    std::string path;
    int64_t modifiedMs;
};

static std::vector<EventDirEntry> eventDirs(const std::string& mediaRoot) {
    std::vector<EventDirEntry> out;
    std::error_code ec;
    for (fs::directory_iterator it(mediaRoot, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code dirEc;
        if (!it->is_directory(dirEc)) continue;
        int64_t m = modifiedMs(it->path());
        if (m >= 0) out.push_back({it->path().string(), m});
    }
    std::sort(out.begin(), out.end(),
              [](const EventDirEntry& a, const EventDirEntry& b) { return a.modifiedMs < b.modifiedMs; });
    return out;
}

int RetentionManager::enforceRolling(const std::string& cameraId, int64_t nowMs) {
    std::lock_guard<std::mutex> lock(mtx);
    const RecorderSettings s = settings();
    auto segments = listSegments(root + "/" + cameraId, s.segmentSeconds);
    if (segments.size() <= 1) return 0;

    int64_t cutoff = nowMs - (int64_t)s.retentionMinutes * 60 * 1000;
    int removed = 0;
    for (size_t i = 0; i + 1 < segments.size(); i++) {
        if (segments[i].endMs >= cutoff) break;
        if (removeSegment(segments[i])) removed++;
    }
    if (removed > 0) logDebug("Retention", cameraId + ": removed " + std::to_string(removed) + " expired segments");
    return removed;
}

bool RetentionManager::removeOldestEventMedia(const std::string& dir) {
    if (dir.empty()) return false;
    auto dirs = eventDirs(dir);
    if (dirs.empty()) return false;
    if (!deleteEventMedia(dirs.front().path)) return false;
    logInfo("Retention", "disk limit: removed event media " + dirs.front().path);
    return true;
}

int RetentionManager::enforceDiskLimit() {
    std::lock_guard<std::mutex> lock(mtx);
    const RecorderSettings s = settings();
    std::string media;
    {
        std::lock_guard<std::mutex> settingsLock(settingsMtx);
        media = mediaRoot;
    }
    int removed = 0;

    while (true) {
        DiskUsageSample usage = sample(s);
        if (!overLimit(usage, s)) break;

        // One round: the oldest finalized segment of every camera holding any.
        int roundRemoved = 0;
        std::error_code ec;
        for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code dirEc;
            if (!it->is_directory(dirEc)) continue;
            auto segments = listSegments(it->path().string(), s.segmentSeconds);
            if (segments.size() <= 1) continue;
            if (removeSegment(segments.front())) {
                roundRemoved++;
                logInfo("Retention", "disk limit: removed " + segments.front().path);
            }
        }
        // Event media counts against the filesystem limit only.
        bool diskFull = usage.percent >= 0 && usage.percent >= s.diskLimitPercent;
        if (diskFull && removeOldestEventMedia(media)) roundRemoved++;

        if (roundRemoved == 0) {
            logWarn("Retention", "disk at " + std::to_string(usage.percent) + "% but nothing left to delete");
            break;
        }
        removed += roundRemoved;
    }
    return removed;
}

int RetentionManager::enforceMediaAge(int64_t nowMs) {
    std::lock_guard<std::mutex> lock(mtx);
    std::string media;
    int days = 0;
    {
        std::lock_guard<std::mutex> settingsLock(settingsMtx);
        media = mediaRoot;
        days = mediaRetentionDays;
    }
    if (media.empty() || days <= 0) return 0;

    const int64_t cutoff = nowMs - (int64_t)days * 24 * 3600 * 1000;
    int removed = 0;
    for (const auto& d : eventDirs(media)) {
        if (d.modifiedMs >= cutoff) break;
        if (deleteEventMedia(d.path)) removed++;
    }
    if (removed > 0) logInfo("Retention", "removed " + std::to_string(removed) + " expired event(s) from " + media);
    return removed;
}
