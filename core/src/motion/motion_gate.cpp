#include <motion/motion_gate.hpp>

#include <algorithm>
#include <iostream>

#include <opencv2/imgproc.hpp>

namespace shelf {
    MotionGate::MotionGate(MotionConfig cfg) {
        if (!set_threshold(cfg.threshold)) threshold_ = MotionConfig{}.threshold;
        blur_size_ = std::max(1, cfg.blur_size);
        if ((blur_size_ % 2) == 0) blur_size_ += 1;
        cooldown_frames_ = std::max(0, cfg.cooldown_frames);
    }

    bool MotionGate::set_threshold(float threshold) {
        if (!(threshold >= 0.0f && threshold <= 1.0f)) {
            std::cerr << "[Motion](set_threshold) rejected threshold " << threshold
                      << ", must be within [0, 1]\n";
            return false;
        }
        threshold_ = threshold;
        return true;
    }

    void MotionGate::reset() {
        baseline_.reset();
        last_score_ = 0.0f;
        cooldown_left_ = 0;
    }

    cv::Mat MotionGate::prepare_(const cv::Mat& frame) const {
        cv::Mat gray;
        if (frame.channels() == 3) {
            cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
        } else if (frame.channels() == 4) {
            cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY);
        } else {
            gray = frame.clone();
        }
        if (blur_size_ > 1) {
            cv::GaussianBlur(gray, gray, cv::Size(blur_size_, blur_size_), 0.0);
        }
        return gray;
    }

    bool MotionGate::should_run_inference(const cv::Mat& frame) {
        if (frame.empty()) return false;

        cv::Mat gray = prepare_(frame);

        // No baseline, or the camera changed resolution: nothing to compare against.
        if (!baseline_ || baseline_->size() != gray.size() || baseline_->type() != gray.type()) {
            baseline_ = std::move(gray);
            return true;
        }

        cv::Mat diff;
        cv::absdiff(*baseline_, gray, diff);
        last_score_ = static_cast<float>(cv::mean(diff)[0] / 255.0);
        baseline_ = std::move(gray);

        if (last_score_ > threshold_) {
            cooldown_left_ = cooldown_frames_;
            return true;
        }

        if (cooldown_left_ > 0) {
            --cooldown_left_;
            return true;
        }
        return false;
    }
}
