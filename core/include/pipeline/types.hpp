#pragma once

#include <opencv2/core.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shelf {
    using Clock = std::chrono::system_clock;

    struct Box {
        float x = 0.0f;
        float y = 0.0f;
        float w = 0.0f;
        float h = 0.0f;

        float x2() const { return x + w; }
        float y2() const { return y + h; }
        float area() const { return std::max(0.0f, w) * std::max(0.0f, h); }
    };

    inline float iou(const Box& a, const Box& b) {
        const float iw = std::max(0.0f, std::min(a.x2(), b.x2()) - std::max(a.x, b.x));
        const float ih = std::max(0.0f, std::min(a.y2(), b.y2()) - std::max(a.y, b.y));
        const float inter = iw * ih;
        if (inter <= 0.0f) return 0.0f;

        const float uni = a.area() + b.area() - inter;
        return uni > 0.0f ? inter / uni : 0.0f;
    }

    // Pixel rectangle in full-frame coordinates, x2/y2 exclusive.
    struct Region {
        int x1 = 0;
        int y1 = 0;
        int x2 = 0;
        int y2 = 0;

        int width() const { return x2 - x1; }
        int height() const { return y2 - y1; }
        cv::Rect rect() const { return {x1, y1, x2 - x1, y2 - y1}; }

        bool operator==(const Region& o) const {
            return x1 == o.x1 && y1 == o.y1 && x2 == o.x2 && y2 == o.y2;
        }
        bool operator!=(const Region& o) const { return !(*this == o); }
    };

    // Raw detector output, before tracking.
    struct Detection {
        Box box;
        int class_id = -1;
        std::string class_name;
        float score = 0.0f;
    };

    struct TrackedDetection {
        int track_id = -1;
        std::string class_name;
        float confidence = 0.0f;
        Box bbox;
    };

    enum class EventType {
        Added,
        Taken
    };

    struct InventoryEvent {
        EventType type = EventType::Added;
        std::string item;
        Clock::time_point timestamp;
        int track_id = -1;
        int count_before = 0;
        int count_after = 0;
    };

    using Counts = std::map<std::string, int>;

    struct InventoryDelta {
        std::string machine_id;
        Clock::time_point timestamp;
        Counts counts;
        std::vector<InventoryEvent> events;
    };

    // One frame handed from the processing thread to the preview encoder.
    // Everything is a copy, so rendering never touches live pipeline state.
    struct PreviewFrame {
        int64_t frame_id = 0;
        int64_t pts_ns = 0;
        cv::Mat frame;
        std::optional<Region> region;
        std::vector<TrackedDetection> detections;
    };

    using PreviewPtr = std::shared_ptr<PreviewFrame>;

    struct PipelineStatus {
        std::string state = "stopped"; // stopped|running
        int64_t frames_seen = 0;
        int64_t frames_processed = 0;
        int64_t inference_runs = 0;
        int64_t tracking_failures = 0;
        int64_t region_rejections = 0;
        double fps = 0.0;
        bool motion_active = false;
        float motion_score = 0.0f;
        std::optional<Clock::time_point> last_detection_time;
        Counts inventory;
    };

    const char* to_wire(EventType t);
}
