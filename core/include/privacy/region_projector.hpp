#pragma once

#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include <pipeline/types.hpp>

namespace shelf {
    struct PrivacyConfig {
        // Gaussian kernel size for the out-of-region blur (forced odd and >= 3).
        int blur_intensity = 51;

        // Outline drawn around the region on the display frame.
        int border_thickness = 2;

        std::optional<Region> roi;
    };

    class PrivacyRegionProjector {
    public:
        explicit PrivacyRegionProjector(PrivacyConfig cfg = {});

        // Validates and applies a new region. frame_size may be empty when the
        // camera resolution is not known yet; bounds are then checked on crop.
        // On rejection the previous region stays in effect.
        bool set_region(const std::optional<Region>& region, cv::Size frame_size = {});
        void clear_region();

        const std::optional<Region>& region() const { return region_; }
        bool has_region() const { return region_.has_value(); }
        int blur_intensity() const { return blur_intensity_; }

        cv::Mat crop(const cv::Mat& frame) const;

        // Region-local -> full-frame coordinates. With a frame size the offset
        // is the one crop() applied to that frame (none if it fell back to the
        // full frame).
        std::vector<TrackedDetection> project_detections(std::vector<TrackedDetection> detections,
                                                         const std::optional<Region>& region,
                                                         cv::Size frame_size = {}) const;

        // Blurred everywhere except inside the region, plus an outline. A
        // region that misses the frame blurs all of it.
        cv::Mat render_for_display(const cv::Mat& frame, const std::optional<Region>& region) const;

        static bool is_valid(const Region& r, cv::Size frame_size);

        // Region clipped to the frame, or nullopt if nothing of it is left.
        static std::optional<cv::Rect> clip_to_frame(const Region& r, cv::Size frame_size);

        int blur_intensity_ = 51;
        int border_thickness_ = 2;
        std::optional<Region> region_;
    };
}
