#include <privacy/region_projector.hpp>

#include <algorithm>
#include <iostream>

#include <opencv2/imgproc.hpp>

namespace shelf {
    namespace {
        const cv::Scalar kBorderColor(0, 255, 0);

        std::ostream& operator<<(std::ostream& os, const Region& r) {
            return os << "(" << r.x1 << ", " << r.y1 << ") -> (" << r.x2 << ", " << r.y2 << ")";
        }
    } // namespace

    PrivacyRegionProjector::PrivacyRegionProjector(PrivacyConfig cfg) {
        blur_intensity_ = std::max(3, cfg.blur_intensity);
        if ((blur_intensity_ % 2) == 0) blur_intensity_ += 1;
        border_thickness_ = std::max(1, cfg.border_thickness);

        if (cfg.roi && !set_region(cfg.roi)) {
            std::cerr << "[Privacy] configured ROI ignored, using full frame\n";
        }
    }

    bool PrivacyRegionProjector::is_valid(const Region& r, cv::Size frame_size) {
        if (r.x1 < 0 || r.y1 < 0) return false;
        if (r.x1 >= r.x2 || r.y1 >= r.y2) return false;
        if (frame_size.width > 0 && r.x2 > frame_size.width) return false;
        if (frame_size.height > 0 && r.y2 > frame_size.height) return false;
        return true;
    }

    bool PrivacyRegionProjector::set_region(const std::optional<Region>& region, cv::Size frame_size) {
        if (!region) {
            clear_region();
            return true;
        }

        if (!is_valid(*region, frame_size)) {
            std::cerr << "[Privacy](set_region) rejected ROI " << *region;
            if (frame_size.width > 0) {
                std::cerr << " for frame " << frame_size.width << "x" << frame_size.height;
            }
            std::cerr << ", keeping previous\n";
            return false;
        }

        region_ = region;
        std::cout << "[Privacy] ROI set to: " << *region_ << "\n";
        return true;
    }

    void PrivacyRegionProjector::clear_region() {
        if (region_) std::cout << "[Privacy] ROI cleared - using full frame\n";
        region_.reset();
    }

    std::optional<cv::Rect> PrivacyRegionProjector::clip_to_frame(const Region& r, cv::Size frame_size) {
        const cv::Rect rect = r.rect() & cv::Rect(0, 0, frame_size.width, frame_size.height);
        if (rect.width <= 0 || rect.height <= 0) return std::nullopt;
        return rect;
    }

    cv::Mat PrivacyRegionProjector::crop(const cv::Mat& frame) const {
        if (!region_ || frame.empty()) return frame;

        const auto rect = clip_to_frame(*region_, frame.size());
        if (!rect) {
            thread_local bool logged = false;
            if (!logged) {
                std::cerr << "[Privacy](crop) ROI " << *region_ << " is outside the "
                          << frame.cols << "x" << frame.rows << " frame, using full frame\n";
                logged = true;
            }
            return frame;
        }
        return frame(*rect).clone();
    }

    std::vector<TrackedDetection> PrivacyRegionProjector::project_detections(
        std::vector<TrackedDetection> detections,
        const std::optional<Region>& region,
        cv::Size frame_size) const {
        if (!region) return detections;

        cv::Point origin(region->x1, region->y1);
        if (frame_size.width > 0 && frame_size.height > 0) {
            const auto rect = clip_to_frame(*region, frame_size);
            if (!rect) return detections;
            origin = rect->tl();
        }

        const float dx = static_cast<float>(origin.x);
        const float dy = static_cast<float>(origin.y);
        for (auto& d : detections) {
            d.bbox.x += dx;
            d.bbox.y += dy;
        }
        return detections;
    }

    cv::Mat PrivacyRegionProjector::render_for_display(const cv::Mat& frame,
                                                       const std::optional<Region>& region) const {
        if (!region || frame.empty()) return frame;

        cv::Mat out;
        cv::GaussianBlur(frame, out, cv::Size(blur_intensity_, blur_intensity_), 0.0, 0.0);

        const auto rect = clip_to_frame(*region, frame.size());
        if (!rect) return out;

        frame(*rect).copyTo(out(*rect));

        // Outline sits just outside the region so in-region pixels stay untouched.
        const int t = border_thickness_;
        const cv::Rect outline = cv::Rect(rect->x - t, rect->y - t, rect->width + 2 * t, rect->height + 2 * t)
                                 & cv::Rect(0, 0, out.cols, out.rows);
        const cv::Rect bounds(0, 0, out.cols, out.rows);
        const cv::Rect bands[4] = {
            cv::Rect(outline.x, outline.y, outline.width, rect->y - outline.y),
            cv::Rect(outline.x, rect->y + rect->height, outline.width, outline.y + outline.height - rect->y - rect->height),
            cv::Rect(outline.x, rect->y, rect->x - outline.x, rect->height),
            cv::Rect(rect->x + rect->width, rect->y, outline.x + outline.width - rect->x - rect->width, rect->height),
        };
        for (const auto& band : bands) {
            const cv::Rect b = band & bounds;
            if (b.width > 0 && b.height > 0) out(b).setTo(kBorderColor);
        }
        return out;
    }
}
