#include <ingest/frame_source_factory.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    void test_webcam_pipeline() {
        shelf::SourceConfig cfg;
        cfg.type = "webcam";
        cfg.webcam.device = "/dev/video2";
        cfg.webcam.mjpg = true;
        const auto p = shelf::build_gst_pipeline(cfg, "sink_cam0");
        check(contains(p, "v4l2src device=/dev/video2"), "webcam pipeline should use the configured device");
        check(contains(p, "jpegdec"), "mjpg webcam should decode jpeg");
        check(contains(p, "appsink name=sink_cam0"), "pipeline should end in the named appsink");

        cfg.webcam.mjpg = false;
        check(!contains(shelf::build_gst_pipeline(cfg, "s"), "jpegdec"), "raw webcam should not decode jpeg");
    }

    void test_rtsp_pipeline() {
        shelf::SourceConfig cfg;
        cfg.type = "rtsp";
        cfg.rtsp.url = "rtsp://cam/1";
        cfg.rtsp.tcp = false;
        const auto p = shelf::build_gst_pipeline(cfg, "s");
        check(contains(p, "location=\"rtsp://cam/1\""), "rtsp pipeline should use the url");
        check(contains(p, "protocols=udp"), "rtsp pipeline should honour the transport");
    }

    void test_file_pipeline_is_paced() {
        shelf::SourceConfig cfg;
        cfg.type = "file";
        cfg.file.path = "/tmp/shelf.mp4";
        const auto p = shelf::build_gst_pipeline(cfg, "s");
        check(contains(p, "filesrc location=\"/tmp/shelf.mp4\""), "file pipeline should read the path");
        check(contains(p, "sync=true"), "file playback should be paced to real time");
    }

    void test_invalid_sources_throw() {
        shelf::SourceConfig cfg;
        cfg.type = "file";
        bool threw = false;
        try { (void)shelf::build_gst_pipeline(cfg, "s"); } catch (const std::runtime_error&) { threw = true; }
        check(threw, "file source without path should throw");

        cfg.type = "usb";
        threw = false;
        try { (void)shelf::build_gst_pipeline(cfg, "s"); } catch (const std::runtime_error&) { threw = true; }
        check(threw, "unknown source type should throw");
    }
}

int main() {
    test_webcam_pipeline();
    test_rtsp_pipeline();
    test_file_pipeline_is_paced();
    test_invalid_sources_throw();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all ingest tests passed\n";
    return 0;
}
