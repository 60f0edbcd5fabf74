#pragma once
#include "dnn_detector.h"
#include "hw_detect.h"
#include "supervisor/Logger.hpp"
#include <memory>

// Picks the DNN backend for the hardware found at startup. Detection is
// probed once per process.
inline std::unique_ptr<ObjectDetector> createDetector(const DetectionSettings& cfg) {
    static const GpuType gpu = detectGpu();

    int backend = cv::dnn::DNN_BACKEND_OPENCV;
    int target = cv::dnn::DNN_TARGET_CPU;
    switch (gpu) {
        case GpuType::NVIDIA:
            backend = cv::dnn::DNN_BACKEND_CUDA;
            target = cv::dnn::DNN_TARGET_CUDA;
            break;
        case GpuType::INTEL_IGPU:
        case GpuType::AMD_IGPU:
            target = cv::dnn::DNN_TARGET_OPENCL;
            break;
        default:
            break;
    }
    logInfo("Engine", std::string("inference on ") + gpuName(gpu));
    return std::make_unique<DnnDetector>(cfg, backend, target);
}
