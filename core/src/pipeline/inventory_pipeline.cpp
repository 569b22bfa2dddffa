#include <pipeline/inventory_pipeline.hpp>

#include <algorithm>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace shelf {
    InventoryPipeline::InventoryPipeline(Options opt, std::unique_ptr<ITrackingCapability> tracking)
        : opt_(std::move(opt)),
          tracking_(std::move(tracking)),
          projector_(opt_.privacy),
          motion_(opt_.motion),
          inventory_(opt_.inventory),
          batcher_(opt_.machine_id, opt_.reconcile_window) {
        if (!tracking_) throw std::invalid_argument("InventoryPipeline requires a tracking capability");
        opt_.process_every_n_frames = std::max(1, opt_.process_every_n_frames);

        batcher_.update_counts(inventory_.counts());
        region_snapshot_ = projector_.region();
        status_.inventory = inventory_.counts();
    }

    bool InventoryPipeline::set_region(const std::optional<Region>& region) {
        std::lock_guard lk(pending_mtx_);
        if (region && !PrivacyRegionProjector::is_valid(*region, last_frame_size_)) {
            std::cerr << "[Pipeline](set_region) rejected ROI (" << region->x1 << ", " << region->y1
                      << ") -> (" << region->x2 << ", " << region->y2 << ")\n";
            return false;
        }
        pending_.has_region = true;
        pending_.region = region;
        return true;
    }

    bool InventoryPipeline::set_motion_threshold(float threshold) {
        if (!(threshold >= 0.0f && threshold <= 1.0f)) {
            std::cerr << "[Pipeline](set_motion_threshold) rejected " << threshold << "\n";
            return false;
        }
        std::lock_guard lk(pending_mtx_);
        pending_.motion_threshold = threshold;
        return true;
    }

    bool InventoryPipeline::set_debounce_threshold(int frames) {
        if (frames < 1) {
            std::cerr << "[Pipeline](set_debounce_threshold) rejected " << frames << "\n";
            return false;
        }
        std::lock_guard lk(pending_mtx_);
        pending_.debounce_frames = frames;
        return true;
    }

    void InventoryPipeline::set_allowed_classes(std::vector<std::string> classes) {
        std::lock_guard lk(pending_mtx_);
        pending_.allowed_classes = std::move(classes);
    }

    void InventoryPipeline::apply_pending_(const cv::Size& frame_size) {
        PendingConfig p;
        {
            std::lock_guard lk(pending_mtx_);
            last_frame_size_ = frame_size;
            std::swap(p, pending_);
        }

        if (p.has_region && p.region != projector_.region()) {
            // A new crop is a different image: the old motion baseline is meaningless.
            if (projector_.set_region(p.region, frame_size)) {
                motion_.reset();
            } else {
                count_region_rejection_();
            }
        }

        // The configured region, or one accepted before any frame was seen,
        // has only been shape-checked. Bounds are known from here on.
        if (frame_size != checked_frame_size_) {
            checked_frame_size_ = frame_size;
            const auto& current = projector_.region();
            if (current && !PrivacyRegionProjector::is_valid(*current, frame_size)) {
                std::cerr << "[Pipeline](apply_pending) ROI (" << current->x1 << ", " << current->y1
                          << ") -> (" << current->x2 << ", " << current->y2 << ") does not fit the "
                          << frame_size.width << "x" << frame_size.height << " frame, dropped\n";
                projector_.clear_region();
                motion_.reset();
                count_region_rejection_();
            }
        }

        if (p.motion_threshold) motion_.set_threshold(*p.motion_threshold);
        if (p.debounce_frames) inventory_.set_debounce_threshold(*p.debounce_frames);
        if (p.allowed_classes) opt_.allowed_classes = std::move(*p.allowed_classes);
    }

    void InventoryPipeline::count_region_rejection_() {
        std::lock_guard lk(status_mtx_);
        status_.region_rejections += 1;
    }

    std::vector<TrackedDetection> InventoryPipeline::filter_allowed_(std::vector<TrackedDetection> detections) const {
        if (opt_.allowed_classes.empty()) return detections;
        const auto& allowed = opt_.allowed_classes;
        detections.erase(
            std::remove_if(detections.begin(),
                           detections.end(),
                           [&allowed](const TrackedDetection& d) {
                               return std::find(allowed.begin(), allowed.end(), d.class_name) == allowed.end();
                           }),
            detections.end());
        return detections;
    }

    void InventoryPipeline::record_frame_time_(std::chrono::steady_clock::time_point start) {
        const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        frame_times_.push_back(secs);
        while (frame_times_.size() > 30) frame_times_.pop_front();
    }

    InventoryPipeline::FrameResult InventoryPipeline::process_frame(const cv::Mat& frame) {
        FrameResult result;
        if (frame.empty()) return result;

        const auto start = std::chrono::steady_clock::now();
        apply_pending_(frame.size());

        {
            std::lock_guard lk(status_mtx_);
            status_.frames_seen += 1;
            region_snapshot_ = projector_.region();
        }

        if (++skip_counter_ < opt_.process_every_n_frames) return result;
        skip_counter_ = 0;
        result.processed = true;

        const cv::Mat roi_frame = projector_.crop(frame);
        result.inference_ran = motion_.should_run_inference(roi_frame);

        if (result.inference_ran) {
            try {
                auto tracked = tracking_->track(roi_frame);
                result.detections = filter_allowed_(
                    projector_.project_detections(std::move(tracked), projector_.region(), frame.size()));
            } catch (const std::exception& e) {
                // Fail open: keep the previous detections so counts do not collapse.
                std::cerr << "[Pipeline](process_frame) tracking failed, reusing previous detections: "
                          << e.what() << "\n";
                result.tracking_failed = true;
                std::lock_guard lk(status_mtx_);
                result.detections = last_detections_;
            }

            result.events = inventory_.update(result.detections);
            batcher_.append(result.events, inventory_.counts());
        }

        record_frame_time_(start);
        const double mean = std::accumulate(frame_times_.begin(), frame_times_.end(), 0.0) /
                            static_cast<double>(frame_times_.size());

        std::lock_guard lk(status_mtx_);
        status_.frames_processed += 1;
        status_.fps = mean > 0.0 ? 1.0 / mean : 0.0;
        status_.motion_active = motion_.is_active();
        status_.motion_score = motion_.last_score();
        status_.inventory = inventory_.counts();
        if (result.inference_ran) {
            status_.inference_runs += 1;
            if (result.tracking_failed) status_.tracking_failures += 1;
            status_.last_detection_time = Clock::now();
            last_detections_ = result.detections;
        }
        return result;
    }

    std::optional<Region> InventoryPipeline::region() const {
        std::lock_guard lk(status_mtx_);
        return region_snapshot_;
    }

    std::vector<TrackedDetection> InventoryPipeline::last_detections() const {
        std::lock_guard lk(status_mtx_);
        return last_detections_;
    }

    PipelineStatus InventoryPipeline::status() const {
        std::lock_guard lk(status_mtx_);
        return status_;
    }

    void InventoryPipeline::set_state(const std::string& state) {
        std::lock_guard lk(status_mtx_);
        status_.state = state;
    }
}
