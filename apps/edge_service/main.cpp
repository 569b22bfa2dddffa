#include <common/config.hpp>
#include <encode/preview_server.hpp>
#include <inference/yolo_detector.hpp>
#include <ingest/frame_source_factory.hpp>
#include <inventory/delta_json.hpp>
#include <pipeline/inventory_pipeline.hpp>
#include <pipeline/runtime.hpp>
#include <push/delta_pusher.hpp>
#include <tracking/tracked_detector.hpp>

#include <yaml-cpp/exceptions.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

static std::atomic<bool> g_running(true);
static std::atomic<bool> g_reload(false);
static void handle_sigint(int) { g_running = false; }
static void handle_sighup(int) { g_reload = true; }

static bool load_config(const std::string& path, shelf::AppConfig& out) {
    try {
        out = shelf::load_config_yaml(path);
        return true;
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
    } catch (const std::runtime_error& e) {
        std::cerr << "Config error: " << e.what() << "\n";
    }
    return false;
}

// Only the settings that can change without restarting the camera.
static void apply_reload(const shelf::AppConfig& cfg, shelf::InventoryPipeline& pipeline) {
    if (!pipeline.set_region(cfg.privacy.roi)) {
        std::cerr << "[Reload] ROI rejected, keeping the previous one\n";
    }
    if (!pipeline.set_motion_threshold(cfg.motion.threshold)) {
        std::cerr << "[Reload] motion threshold rejected\n";
    }
    if (!pipeline.set_debounce_threshold(cfg.inventory.debounce_frames)) {
        std::cerr << "[Reload] debounce rejected\n";
    }
    pipeline.set_allowed_classes(cfg.detector.allowed_classes);
    pipeline.batcher().set_reconcile_window(std::chrono::milliseconds(cfg.reconcile_window_ms));
    std::cerr << "[Reload] configuration applied\n";
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);
    std::signal(SIGHUP, handle_sighup);

    std::string cfg_path = "configs/edge.yaml";
    if (argc >= 2) cfg_path = argv[1];
    else std::cerr << "Using default config: " << cfg_path << "\n";

    shelf::AppConfig cfg;
    if (!load_config(cfg_path, cfg)) return 1;

    std::unique_ptr<shelf::InventoryPipeline> pipeline;
    std::unique_ptr<shelf::IFrameSource> source;
    try {
        auto detector = std::make_shared<const shelf::YoloDetector>(cfg.detector.yolo);
        auto tracking = std::make_unique<shelf::TrackedDetector>(detector, cfg.tracker);

        shelf::InventoryPipeline::Options opt;
        opt.machine_id = cfg.machine_id;
        opt.motion = cfg.motion;
        opt.inventory = cfg.inventory;
        opt.privacy = cfg.privacy;
        opt.allowed_classes = cfg.detector.allowed_classes;
        opt.process_every_n_frames = cfg.pipeline.process_every_n_frames;
        opt.reconcile_window = std::chrono::milliseconds(cfg.reconcile_window_ms);
        pipeline = std::make_unique<shelf::InventoryPipeline>(std::move(opt), std::move(tracking));

        source = shelf::make_frame_source(cfg.source);
    } catch (const std::exception& e) {
        std::cerr << "Startup failed: " << e.what() << "\n";
        return 1;
    }

    shelf::PreviewServer server(cfg.server.host, cfg.server.port);
    server.set_inventory_provider([&pipeline] { return shelf::to_json(pipeline->status()); });
    if (!server.start()) {
        std::cerr << "Preview server failed to start\n";
        return 1;
    }

    shelf::DeltaPusher pusher(cfg.api);
    if (!cfg.api.api_key.empty() && !pusher.health_check()) {
        std::cerr << "[Main] API at " << cfg.api.url << " is not reachable yet; deltas will be retried\n";
    }

    shelf::PipelineRuntime::Options ropt;
    ropt.stream_id = cfg.source.id;
    ropt.jpeg_quality = cfg.pipeline.jpeg_quality;
    ropt.preview_cap = cfg.pipeline.preview_cap;
    ropt.batch_interval = std::chrono::milliseconds(cfg.api.batch_interval_ms);

    shelf::PipelineRuntime runtime(server, *pipeline, pusher, std::move(source), ropt);
    if (!runtime.start()) {
        server.stop();
        return 1;
    }

    std::cerr << "[Main] machine " << cfg.machine_id << " running\n";
    while (g_running) {
        if (g_reload.exchange(false)) {
            shelf::AppConfig fresh;
            if (load_config(cfg_path, fresh)) apply_reload(fresh, *pipeline);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "Shutting down...\n";
    runtime.stop();
    pusher.stop();
    server.stop();
    return 0;
}
