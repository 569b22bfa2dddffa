#pragma once

#include <optional>

#include <opencv2/core.hpp>

namespace shelf {
    struct MotionConfig {
        // Mean absolute grey-level difference, normalised to [0,1], above which
        // the frame counts as motion. 0.008 picks up a hand at the shelf.
        float threshold = 0.008f;

        // Gaussian kernel applied before differencing (forced odd).
        int blur_size = 21;

        // Frames the gate stays open after the last motion. 0 disables.
        int cooldown_frames = 0;
    };

    class MotionGate {
    public:
        explicit MotionGate(MotionConfig cfg = {});

        bool should_run_inference(const cv::Mat& frame);

        // Drops the baseline: the next call returns true.
        void reset();

        bool set_threshold(float threshold);
        float threshold() const { return threshold_; }

        bool has_baseline() const { return baseline_.has_value(); }
        float last_score() const { return last_score_; }
        bool is_active() const { return cooldown_left_ > 0 || last_score_ > threshold_; }

    private:
        cv::Mat prepare_(const cv::Mat& frame) const;

        float threshold_ = 0.008f;
        int blur_size_ = 21;
        int cooldown_frames_ = 0;

        std::optional<cv::Mat> baseline_;
        float last_score_ = 0.0f;
        int cooldown_left_ = 0;
    };
}
