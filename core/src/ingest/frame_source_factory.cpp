#include <ingest/frame_source_factory.hpp>
#include <ingest/gst_frame_source.hpp>

#include <stdexcept>

namespace shelf {
    static std::string appsink(const std::string& sink_name) {
        return "appsink name=" + sink_name + " max-buffers=2 drop=true sync=false";
    }

    static std::string web_pipeline(const WebcamConfig& c, const std::string& sink_name) {
        if (c.mjpg) {
            return "v4l2src device=" + c.device + " ! "
                   "image/jpeg,width=" + std::to_string(c.width)
                   + ",height=" + std::to_string(c.height)
                   + ",framerate=" + std::to_string(c.fps) + "/1 ! "
                   "jpegdec ! videoconvert ! video/x-raw,format=BGR ! " + appsink(sink_name);
        }
        return "v4l2src device=" + c.device + " ! "
               "video/x-raw,width=" + std::to_string(c.width)
               + ",height=" + std::to_string(c.height)
               + ",framerate=" + std::to_string(c.fps) + "/1 ! "
               "videoconvert ! video/x-raw,format=BGR ! " + appsink(sink_name);
    }

    static std::string file_pipeline(const FileConfig& c, const std::string& sink_name) {
        // sync=false on the sink would race through the file; pace it to real time.
        return "filesrc location=\"" + c.path + "\" ! "
               "decodebin ! videoconvert ! video/x-raw,format=BGR ! "
               "appsink name=" + sink_name + " max-buffers=2 drop=false sync=true";
    }

    static std::string rtsp_pipeline(const RTSPConfig& c, const std::string& sink_name) {
        std::string proto = c.tcp ? "tcp" : "udp";
        return "rtspsrc location=\"" + c.url +
               "\" latency=" + std::to_string(c.latency_ms) +
               " protocols=" + proto + " drop-on-latency=true ! "
               "decodebin ! videoconvert ! video/x-raw,format=BGR ! " + appsink(sink_name);
    }

    std::string build_gst_pipeline(const SourceConfig& cfg, const std::string& sink_name) {
        if (cfg.type == "webcam") {
            return web_pipeline(cfg.webcam, sink_name);
        }
        if (cfg.type == "file") {
            if (cfg.file.path.empty()) {
                throw std::runtime_error("file.path is empty in config");
            }
            return file_pipeline(cfg.file, sink_name);
        }
        if (cfg.type == "rtsp") {
            if (cfg.rtsp.url.empty()) {
                throw std::runtime_error("rtsp.url is empty in config");
            }
            return rtsp_pipeline(cfg.rtsp, sink_name);
        }
        throw std::runtime_error("Unknown source type " + cfg.type);
    }

    std::unique_ptr<IFrameSource> make_frame_source(const SourceConfig& cfg) {
        const std::string sink_name = "sink_" + cfg.id;
        const std::string pipe = build_gst_pipeline(cfg, sink_name);
        const bool loop = cfg.type == "file" && cfg.file.loop;
        return std::make_unique<GstFrameSource>(pipe, cfg.id, sink_name, loop);
    }
}
