#pragma once

#include <cstdint>
#include <string>
#include <opencv2/core.hpp>

namespace shelf {
    struct FramePacket {
        cv::Mat bgr;
        int64_t pts_ns = 0;
        int64_t frame_id = 0;
    };
}
