#pragma once

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include <pipeline/types.hpp>

namespace shelf {
    struct YoloDetectorConfig {
        // ncnn export of a YOLO11 model (input "in0", output "out0").
        std::string param_path = "models/detector/yolo11n.ncnn.param";
        std::string bin_path = "models/detector/yolo11n.ncnn.bin";
        int input_size = 640;
        float confidence = 0.4f;
        float nms_threshold = 0.45f;
        int top_k = 300;
        int ncnn_threads = 2;

        // Index -> label. Empty means the COCO label set.
        std::vector<std::string> class_names;
    };

    const std::vector<std::string>& coco_class_names();

    class YoloDetector {
    public:
        explicit YoloDetector(YoloDetectorConfig cfg);
        ~YoloDetector();

        YoloDetector(YoloDetector&&) noexcept;
        YoloDetector& operator=(YoloDetector&&) noexcept;

        YoloDetector(const YoloDetector&) = delete;
        YoloDetector& operator=(const YoloDetector&) = delete;

        // Boxes are in the pixel space of the given image.
        std::vector<Detection> detect(const cv::Mat& bgr) const;

        const std::vector<std::string>& class_names() const { return cfg_.class_names; }

    private:
        YoloDetectorConfig cfg_;
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
