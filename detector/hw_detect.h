#pragma once
#include <cstdlib>
#include <string>

enum class GpuType {
    NVIDIA,
    INTEL_IGPU,
    AMD_IGPU,
    UNKNOWN
};

inline const char* gpuName(GpuType gpu) {
    switch (gpu) {
        case GpuType::NVIDIA: return "NVIDIA GPU";
        case GpuType::INTEL_IGPU: return "Intel iGPU";
        case GpuType::AMD_IGPU: return "AMD GPU";
        default: return "CPU";
    }
}

inline GpuType detectGpu() {
    if (std::system("nvidia-smi > /dev/null 2>&1") == 0) {
        return GpuType::NVIDIA;
    }

    if (std::system("ls /dev/dri/renderD* > /dev/null 2>&1") == 0) {
        if (std::system("lspci 2>/dev/null | grep -Ei '(VGA|Display).*Intel' > /dev/null 2>&1") == 0) {
            return GpuType::INTEL_IGPU;
        }
        if (std::system("lspci 2>/dev/null | grep -Ei '(VGA|Display).*AMD' > /dev/null 2>&1") == 0) {
            return GpuType::AMD_IGPU;
        }
    }
    return GpuType::UNKNOWN;
}
