#pragma once
#include <string>
#include <cstdint>

struct DiskUsageSample {
    int percent = -1;         // filesystem usage, -1 if unknown
    uint64_t usedBytes = 0;   // bytes under the measured directory
};

int getDiskUsagePercent(const std::string& path);
uint64_t directorySizeBytes(const std::string& path);
