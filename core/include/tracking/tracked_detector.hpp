#pragma once

#include <memory>

#include <inference/yolo_detector.hpp>
#include <tracking/tracker.hpp>

namespace shelf {
    // YOLO detection followed by IoU tracking.
    class TrackedDetector final : public ITrackingCapability {
    public:
        TrackedDetector(std::shared_ptr<const YoloDetector> detector, TrackerConfig tracker_cfg);

        std::vector<TrackedDetection> track(const cv::Mat& image) override;

    private:
        std::shared_ptr<const YoloDetector> detector_;
        TrackerConfig tracker_cfg_;
        std::unique_ptr<ITracker> tracker_;
    };
}
