#pragma once

#include <string>
#include <vector>

#include <inference/yolo_detector.hpp>
#include <inventory/state_machine.hpp>
#include <motion/motion_gate.hpp>
#include <privacy/region_projector.hpp>
#include <tracking/tracker.hpp>

namespace shelf {
    struct WebcamConfig {
        std::string device = "/dev/video0";
        int width = 1280;
        int height = 720;
        int fps = 30;
        bool mjpg = true;
    };

    struct FileConfig {
        std::string path;
        bool loop = false;
    };

    struct RTSPConfig {
        std::string url;
        int latency_ms = 200;
        bool tcp = true;
    };

    struct SourceConfig {
        std::string type = "webcam"; // webcam|file|rtsp
        std::string id = "cam0";

        WebcamConfig webcam;
        FileConfig file;
        RTSPConfig rtsp;
    };

    struct ServerConfig {
        std::string host = "0.0.0.0";
        int port = 8080;
    };

    struct DetectorConfig {
        YoloDetectorConfig yolo;
        // Only these labels reach the inventory. Empty means all.
        std::vector<std::string> allowed_classes;
    };

    struct PipelineConfig {
        int process_every_n_frames = 1;
        int jpeg_quality = 75;
        size_t preview_cap = 2;
    };

    struct ApiConfig {
        std::string url = "http://127.0.0.1:8000";
        std::string api_key;
        int timeout_ms = 10000;
        int max_retries = 3;
        int batch_interval_ms = 1000;
    };

    struct AppConfig {
        std::string machine_id = "shelfwatch-edge-001";
        ServerConfig server;
        SourceConfig source;
        DetectorConfig detector;
        TrackerConfig tracker;
        MotionConfig motion;
        InventoryConfig inventory;
        int reconcile_window_ms = 0;
        PrivacyConfig privacy;
        PipelineConfig pipeline;
        ApiConfig api;
    };

    AppConfig load_config_yaml(const std::string& path);
}
