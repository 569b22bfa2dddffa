#pragma once

#include <memory>
#include <vector>

#include <opencv2/core.hpp>

#include <pipeline/types.hpp>

namespace shelf {
    struct TrackerConfig {
        float high_thresh = 0.5f;
        float low_thresh = 0.1f;
        float new_track_thresh = 0.6f;
        float match_iou_thresh = 0.3f;
        float low_match_iou_thresh = 0.2f;
        int min_hits = 1;
        // Frames a lost track keeps its id before it is dropped.
        int max_missed = 30;
    };

    // Associates per-frame detections into persistent track ids.
    class ITracker {
    public:
        virtual ~ITracker() = default;
        virtual std::vector<TrackedDetection> update(const std::vector<Detection>& detections) = 0;
    };

    std::unique_ptr<ITracker> create_iou_tracker(const TrackerConfig& cfg = {});

    // Detection + tracking as one black box: image in, tracked detections out.
    // Implementations may throw; the pipeline treats that as a transient fault.
    class ITrackingCapability {
    public:
        virtual ~ITrackingCapability() = default;
        virtual std::vector<TrackedDetection> track(const cv::Mat& image) = 0;
    };
}
