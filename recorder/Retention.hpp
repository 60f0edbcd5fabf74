#pragma once
#include "supervisor/Config.hpp"
#include "supervisor/DiskUsage.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

// Deletes recording segments: by age per camera, and across all cameras
// when the disk (or the recordings budget) is at its limit. The newest
// segment of a camera is the one being written and is never deleted.
// Event media directories expire after media.retention_days and are also
// trimmed, oldest first, while the filesystem is over its limit.
class RetentionManager {
public:
    using UsageProbe = std::function<DiskUsageSample()>;

    RetentionManager(std::string recordingsRoot, RecorderSettings settings);

    void setUsageProbe(UsageProbe probe) { usageProbe = std::move(probe); }
    void updateSettings(const RecorderSettings& settings);
    void setMedia(const MediaSettings& media);

    // Returns the number of segments removed.
    int enforceRolling(const std::string& cameraId, int64_t nowMs);
    // Returns the number of segments and event directories removed.
    int enforceDiskLimit();
    // Returns the number of event directories removed.
    int enforceMediaAge(int64_t nowMs);

    bool overLimit(const DiskUsageSample& usage) const;
    DiskUsageSample sample() const;

private:
    RecorderSettings settings() const;
    DiskUsageSample sample(const RecorderSettings& s) const;
    static bool overLimit(const DiskUsageSample& usage, const RecorderSettings& s);
    bool removeOldestEventMedia(const std::string& mediaRoot);

    std::string root;
    UsageProbe usageProbe;

    mutable std::mutex settingsMtx;
    RecorderSettings cfg;
    std::string mediaRoot;
    int mediaRetentionDays = 0;

    std::mutex mtx;   // one cleanup pass at a time
};

// Deletes one event's media, largest first (clip, preview, collage), then
// its directory.
bool deleteEventMedia(const std::string& eventDir);
