#include <tracking/tracked_detector.hpp>

#include <stdexcept>
#include <utility>

namespace shelf {
    TrackedDetector::TrackedDetector(std::shared_ptr<const YoloDetector> detector, TrackerConfig tracker_cfg)
        : detector_(std::move(detector)),
          tracker_cfg_(std::move(tracker_cfg)),
          tracker_(create_iou_tracker(tracker_cfg_)) {
        if (!detector_) throw std::invalid_argument("TrackedDetector requires a detector");
    }

    std::vector<TrackedDetection> TrackedDetector::track(const cv::Mat& image) {
        return tracker_->update(detector_->detect(image));
    }
}
