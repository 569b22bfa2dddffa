#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include <inventory/delta_batcher.hpp>
#include <inventory/state_machine.hpp>
#include <motion/motion_gate.hpp>
#include <privacy/region_projector.hpp>
#include <tracking/tracker.hpp>

#include <pipeline/types.hpp>

namespace shelf {
    // Runs frames through crop -> motion gate -> tracking -> projection ->
    // inventory -> batcher, one at a time. process_frame() must only be called
    // from one thread; setters and snapshots may be called from any thread.
    class InventoryPipeline {
    public:
        struct Options {
            std::string machine_id = "shelfwatch-edge-001";
            MotionConfig motion;
            InventoryConfig inventory;
            PrivacyConfig privacy;
            std::vector<std::string> allowed_classes;
            int process_every_n_frames = 1;
            std::chrono::milliseconds reconcile_window{0};
        };

        struct FrameResult {
            bool processed = false; // false when skipped by process_every_n_frames
            bool inference_ran = false;
            bool tracking_failed = false;
            std::vector<TrackedDetection> detections; // full-frame coordinates
            std::vector<InventoryEvent> events;
        };

        InventoryPipeline(Options opt, std::unique_ptr<ITrackingCapability> tracking);

        FrameResult process_frame(const cv::Mat& frame);

        // Validated now, applied before the next frame. false = rejected, the
        // value in effect does not change. Before the first frame a region can
        // only be shape-checked; if it then does not fit the frame it is
        // dropped and counted in PipelineStatus::region_rejections.
        bool set_region(const std::optional<Region>& region);
        bool set_motion_threshold(float threshold);
        bool set_debounce_threshold(int frames);
        void set_allowed_classes(std::vector<std::string> classes);

        DeltaBatcher& batcher() { return batcher_; }
        const PrivacyRegionProjector& projector() const { return projector_; }

        // Region in effect for the frame being processed.
        std::optional<Region> region() const;
        std::vector<TrackedDetection> last_detections() const;
        PipelineStatus status() const;
        void set_state(const std::string& state);

    private:
        struct PendingConfig {
            bool has_region = false;
            std::optional<Region> region;
            std::optional<float> motion_threshold;
            std::optional<int> debounce_frames;
            std::optional<std::vector<std::string>> allowed_classes;
        };

        void apply_pending_(const cv::Size& frame_size);
        void count_region_rejection_();
        std::vector<TrackedDetection> filter_allowed_(std::vector<TrackedDetection> detections) const;
        void record_frame_time_(std::chrono::steady_clock::time_point start);

        Options opt_;
        std::unique_ptr<ITrackingCapability> tracking_;

        // processing-thread state
        PrivacyRegionProjector projector_;
        MotionGate motion_;
        InventoryStateMachine inventory_;
        DeltaBatcher batcher_;
        int skip_counter_ = 0;
        std::deque<double> frame_times_;
        cv::Size checked_frame_size_;

        mutable std::mutex pending_mtx_;
        PendingConfig pending_;
        cv::Size last_frame_size_;

        mutable std::mutex status_mtx_;
        PipelineStatus status_;
        std::optional<Region> region_snapshot_;
        std::vector<TrackedDetection> last_detections_;
    };
}
