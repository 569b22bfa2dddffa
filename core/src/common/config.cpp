#include <common/config.hpp>

#include <algorithm>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace shelf {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static float get_float(
        const YAML::Node& n, const char* key, float def) {
        return (n && n[key]) ? n[key].as<float>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static std::vector<std::string> get_str_list(
        const YAML::Node& n, const char* key) {
        if (!n || !n[key]) return {};
        if (!n[key].IsSequence()) {
            throw std::runtime_error(std::string("[Config] ") + key + " must be a list!");
        }
        return n[key].as<std::vector<std::string>>();
    }

    static SourceConfig parse_source_config(const YAML::Node& s) {
        SourceConfig c;
        if (!s) return c;
        c.type = get_str(s, "type", c.type);
        c.id = get_str(s, "id", c.id);

        if (const YAML::Node wc = s["webcam"]) {
            c.webcam.device = get_str(wc, "device", c.webcam.device);
            c.webcam.width = get_int(wc, "width", c.webcam.width);
            c.webcam.height = get_int(wc, "height", c.webcam.height);
            c.webcam.fps = get_int(wc, "fps", c.webcam.fps);
            c.webcam.mjpg = get_bool(wc, "mjpg", get_bool(wc, "mjpeg", c.webcam.mjpg));
        }
        if (const YAML::Node fc = s["file"]) {
            c.file.path = get_str(fc, "path", c.file.path);
            c.file.loop = get_bool(fc, "loop", c.file.loop);
        }
        if (const YAML::Node rc = s["rtsp"]) {
            c.rtsp.url = get_str(rc, "url", c.rtsp.url);
            c.rtsp.latency_ms = get_int(rc, "latency_ms", c.rtsp.latency_ms);
            c.rtsp.tcp = get_bool(rc, "tcp", c.rtsp.tcp);
        }

        if (c.type != "webcam" && c.type != "file" && c.type != "rtsp") {
            throw std::runtime_error("[Config] unknown source type: " + c.type);
        }
        if (c.type == "rtsp" && c.rtsp.url.empty()) {
            throw std::runtime_error("[Config] RTSP source " + c.id + " has empty URL!");
        }
        if (c.type == "file" && c.file.path.empty()) {
            throw std::runtime_error("[Config] file source " + c.id + " has empty path!");
        }
        return c;
    }

    static DetectorConfig parse_detector_config(const YAML::Node& d) {
        DetectorConfig c;
        if (!d) return c;
        c.yolo.param_path = get_str(d, "param_path", c.yolo.param_path);
        c.yolo.bin_path = get_str(d, "bin_path", c.yolo.bin_path);
        c.yolo.input_size = get_int(d, "input_size", c.yolo.input_size);
        c.yolo.confidence = get_float(d, "confidence", c.yolo.confidence);
        c.yolo.nms_threshold = get_float(d, "nms_threshold", c.yolo.nms_threshold);
        c.yolo.top_k = get_int(d, "top_k", c.yolo.top_k);
        c.yolo.ncnn_threads = get_int(d, "ncnn_threads", c.yolo.ncnn_threads);
        c.yolo.class_names = get_str_list(d, "class_names");
        c.allowed_classes = get_str_list(d, "allowed_classes");

        if (c.yolo.input_size <= 0 || (c.yolo.input_size % 32) != 0) {
            throw std::runtime_error("[Config] detector.input_size must be a positive multiple of 32!");
        }
        if (c.yolo.confidence < 0.0f || c.yolo.confidence > 1.0f) {
            throw std::runtime_error("[Config] detector.confidence must be within [0, 1]!");
        }
        return c;
    }

    static TrackerConfig parse_tracker_config(const YAML::Node& t) {
        TrackerConfig c;
        if (!t) return c;
        c.high_thresh = get_float(t, "high_thresh", c.high_thresh);
        c.low_thresh = get_float(t, "low_thresh", c.low_thresh);
        c.new_track_thresh = get_float(t, "new_track_thresh", c.new_track_thresh);
        c.match_iou_thresh = get_float(t, "match_iou_thresh", c.match_iou_thresh);
        c.low_match_iou_thresh = get_float(t, "low_match_iou_thresh", c.low_match_iou_thresh);
        c.min_hits = get_int(t, "min_hits", c.min_hits);
        c.max_missed = get_int(t, "max_missed", c.max_missed);
        if (c.low_thresh > c.high_thresh) {
            throw std::runtime_error("[Config] tracker.low_thresh must not exceed tracker.high_thresh!");
        }
        return c;
    }

    static MotionConfig parse_motion_config(const YAML::Node& m) {
        MotionConfig c;
        if (!m) return c;
        c.threshold = get_float(m, "threshold", c.threshold);
        c.blur_size = get_int(m, "blur_size", c.blur_size);
        c.cooldown_frames = get_int(m, "cooldown_frames", c.cooldown_frames);
        if (c.threshold < 0.0f || c.threshold > 1.0f) {
            throw std::runtime_error("[Config] motion.threshold must be within [0, 1]!");
        }
        return c;
    }

    static InventoryConfig parse_inventory_config(const YAML::Node& i) {
        InventoryConfig c;
        if (!i) return c;
        c.debounce_frames = get_int(i, "debounce_frames", c.debounce_frames);
        if (c.debounce_frames < 1) {
            throw std::runtime_error("[Config] inventory.debounce_frames must be >= 1!");
        }

        const YAML::Node baseline = i["baseline"];
        if (baseline) {
            if (!baseline.IsMap()) {
                throw std::runtime_error("[Config] inventory.baseline must be a map!");
            }
            for (auto it = baseline.begin(); it != baseline.end(); ++it) {
                const auto item = it->first.as<std::string>();
                const int count = it->second.as<int>();
                if (count < 0) {
                    throw std::runtime_error("[Config] baseline count for " + item + " is negative!");
                }
                c.baseline[item] = count;
            }
        }
        return c;
    }

    static std::optional<Region> parse_roi(const YAML::Node& r) {
        if (!r || r.IsNull()) return std::nullopt;
        if (!r.IsMap() || !r["x1"] || !r["y1"] || !r["x2"] || !r["y2"]) {
            throw std::runtime_error("[Config] privacy.roi needs x1, y1, x2, y2!");
        }
        Region roi;
        roi.x1 = r["x1"].as<int>();
        roi.y1 = r["y1"].as<int>();
        roi.x2 = r["x2"].as<int>();
        roi.y2 = r["y2"].as<int>();
        if (!PrivacyRegionProjector::is_valid(roi, cv::Size())) {
            throw std::runtime_error("[Config] privacy.roi is malformed!");
        }
        return roi;
    }

    static PrivacyConfig parse_privacy_config(const YAML::Node& p) {
        PrivacyConfig c;
        if (!p) return c;
        c.blur_intensity = get_int(p, "blur_intensity", c.blur_intensity);
        c.border_thickness = get_int(p, "border_thickness", c.border_thickness);
        c.roi = parse_roi(p["roi"]);
        return c;
    }

    static PipelineConfig parse_pipeline_config(const YAML::Node& p) {
        PipelineConfig c;
        if (!p) return c;
        c.process_every_n_frames = get_int(p, "process_every_n_frames", c.process_every_n_frames);
        c.jpeg_quality = get_int(p, "jpeg_quality", c.jpeg_quality);
        c.preview_cap = static_cast<size_t>(std::max(1, get_int(p, "preview_cap", static_cast<int>(c.preview_cap))));
        if (c.process_every_n_frames < 1) {
            throw std::runtime_error("[Config] pipeline.process_every_n_frames must be >= 1!");
        }
        return c;
    }

    static ApiConfig parse_api_config(const YAML::Node& a) {
        ApiConfig c;
        if (!a) return c;
        c.url = get_str(a, "url", c.url);
        c.api_key = get_str(a, "api_key", c.api_key);
        c.timeout_ms = get_int(a, "timeout_ms", c.timeout_ms);
        c.max_retries = get_int(a, "max_retries", c.max_retries);
        c.batch_interval_ms = get_int(a, "batch_interval_ms", c.batch_interval_ms);
        if (c.max_retries < 1) {
            throw std::runtime_error("[Config] api.max_retries must be >= 1!");
        }
        if (c.batch_interval_ms < 100) {
            throw std::runtime_error("[Config] api.batch_interval_ms must be >= 100!");
        }
        return c;
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);

        cfg.machine_id = get_str(root, "machine_id", cfg.machine_id);
        if (cfg.machine_id.empty()) {
            throw std::runtime_error("[Config] machine_id must not be empty!");
        }

        const YAML::Node srv = root["server"];
        cfg.server.host = get_str(srv, "host", cfg.server.host);
        cfg.server.port = get_int(srv, "port", cfg.server.port);

        cfg.source = parse_source_config(root["source"]);
        cfg.detector = parse_detector_config(root["detector"]);
        cfg.tracker = parse_tracker_config(root["tracker"]);
        cfg.motion = parse_motion_config(root["motion"]);
        cfg.inventory = parse_inventory_config(root["inventory"]);
        cfg.reconcile_window_ms = get_int(root["inventory"], "reconcile_window_ms", 0);
        cfg.privacy = parse_privacy_config(root["privacy"]);
        cfg.pipeline = parse_pipeline_config(root["pipeline"]);
        cfg.api = parse_api_config(root["api"]);

        if (cfg.reconcile_window_ms < 0) {
            throw std::runtime_error("[Config] inventory.reconcile_window_ms must be >= 0!");
        }
        return cfg;
    }
}
