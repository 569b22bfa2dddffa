#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <opencv2/core.hpp>

namespace shelf {
    // Local HTTP preview of one camera. Only frames that already went through
    // PrivacyRegionProjector::render_for_display may be published here.
    //
    //   GET /preview.mjpg  multipart MJPEG
    //   GET /preview.jpg   latest frame (204 before the first one)
    //   GET /status        pipeline status pushed with the latest frame
    //   GET /inventory     current counts (503 without a provider)
    //   GET /health
    class PreviewServer {
    public:
        using JsonProvider = std::function<std::string()>;

        // port 0 binds any free port; port() tells which after start().
        PreviewServer(std::string host, int port);
        ~PreviewServer();

        PreviewServer(const PreviewServer&) = delete;
        PreviewServer& operator=(const PreviewServer&) = delete;

        bool start();
        void stop();

        // JPEG-encodes the frame and makes it the current preview.
        bool publish(const cv::Mat& frame, int quality, std::string status_json);

        void set_inventory_provider(JsonProvider provider);

        int port() const;
        uint64_t frames_published() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };
}
