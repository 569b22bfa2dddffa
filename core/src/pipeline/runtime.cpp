#include <pipeline/runtime.hpp>

#include <chrono>
#include <cstdio>
#include <iostream>
#include <utility>

#include <opencv2/imgproc.hpp>

#include <inventory/delta_json.hpp>

namespace shelf {
    PipelineRuntime::PipelineRuntime(PreviewServer& server,
                                     InventoryPipeline& pipeline,
                                     IDeltaSink& sink,
                                     std::unique_ptr<IFrameSource> source,
                                     Options opt)
                                         : server_(server),
                                           pipeline_(pipeline),
                                           source_(std::move(source)),
                                           opt_(std::move(opt)),
                                           preview_in_(opt_.preview_cap),
                                           forwarder_(pipeline.batcher(), sink) {}

    bool PipelineRuntime::start() {
        if (running_) return true;
        if (!source_) {
            std::cerr << "[Pipeline](start) no frame source.\n";
            return false;
        }

        if (!source_->start()) {
            std::cerr << "[Pipeline](start) start() failed for " << source_->id() << ".\n";
            return false;
        }

        running_ = true;
        pipeline_.set_state("running");

        process_thr_ = std::thread([this] { process_loop_(); });
        push_thr_ = std::thread([this] { push_loop_(); });
        enc_thr_ = std::thread([this] { encoder_loop_(); });
        return true;
    }

    void PipelineRuntime::stop() {
        if (!running_) return;
        running_ = false;

        preview_in_.close();
        push_cv_.notify_all();

        if (process_thr_.joinable()) process_thr_.join();
        if (enc_thr_.joinable()) enc_thr_.join();
        if (push_thr_.joinable()) push_thr_.join();

        source_->stop();
        pipeline_.set_state("stopped");
        std::cout << "[Pipeline](stop) " << opt_.stream_id << ": "
                  << preview_in_.evicted() << " preview frame(s) dropped\n";

        if (forwarder_.has_undelivered()) {
            std::cerr << "[Pipeline](stop) " << forwarder_.undelivered_events()
                      << " event(s) could not be delivered before shutdown\n";
        }
    }

    // loops
    void PipelineRuntime::process_loop_() {
        FramePacket fp;
        while (running_.load(std::memory_order_relaxed)) {
            if (!source_->read(fp, opt_.read_timeout_ms)) continue;
            if (fp.bgr.empty()) continue;

            const auto res = pipeline_.process_frame(fp.bgr);

            auto preview = std::make_shared<PreviewFrame>();
            preview->frame_id = fp.frame_id;
            preview->pts_ns = fp.pts_ns;
            preview->frame = std::move(fp.bgr);
            preview->region = pipeline_.region();
            preview->detections = res.processed ? res.detections : pipeline_.last_detections();
            preview_in_.post(std::move(preview));
        }
    }

    void PipelineRuntime::push_loop_() {
        while (running_.load(std::memory_order_relaxed)) {
            {
                std::unique_lock lk(push_mtx_);
                push_cv_.wait_for(lk, opt_.batch_interval, [this] { return !running_.load(); });
            }
            forwarder_.forward_once();
        }
    }

    void PipelineRuntime::encoder_loop_() {
        while (running_.load(std::memory_order_relaxed)) {
            PreviewPtr p;
            if (!preview_in_.take(p, std::chrono::milliseconds(200))) continue;
            if (!p || p->frame.empty()) continue;

            const cv::Mat ui = render_preview_(*p);
            if (!server_.publish(ui, opt_.jpeg_quality, preview_status_(*p, ui))) {
                std::cerr << "[Pipeline](encoder) frame " << p->frame_id << " not published\n";
            }
        }
    }

    // hooks

    cv::Mat PipelineRuntime::render_preview_(const PreviewFrame& p) const {
        cv::Mat ui = pipeline_.projector().render_for_display(p.frame, p.region);
        if (ui.data == p.frame.data) ui = ui.clone();

        const cv::Scalar color(0, 255, 0);
        for (const auto& det : p.detections) {
            const cv::Rect r(static_cast<int>(det.bbox.x),
                             static_cast<int>(det.bbox.y),
                             static_cast<int>(det.bbox.w),
                             static_cast<int>(det.bbox.h));
            cv::rectangle(ui, r, color, 2);

            char conf[16];
            std::snprintf(conf, sizeof(conf), "%.2f", det.confidence);
            const std::string label = det.class_name + " #" + std::to_string(det.track_id) + " (" + conf + ")";

            int baseline = 0;
            const cv::Size ts = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, 0.5, 2, &baseline);
            cv::rectangle(ui, cv::Point(r.x, r.y - ts.height - 10), cv::Point(r.x + ts.width, r.y), color, cv::FILLED);
            cv::putText(ui, label, cv::Point(r.x, r.y - 5), cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(0, 0, 0), 2);
        }
        return ui;
    }

    std::string PipelineRuntime::preview_status_(const PreviewFrame& p, const cv::Mat& ui) const {
        const PipelineStatus st = pipeline_.status();
        return "{"
               "\"source\":\"" + json_escape(opt_.stream_id) + "\","
               "\"frame_id\":" + std::to_string(p.frame_id) + ","
               "\"pts_ns\":" + std::to_string(p.pts_ns) + ","
               "\"w\":" + std::to_string(ui.cols) + ","
               "\"h\":" + std::to_string(ui.rows) + ","
               "\"tracks\":" + std::to_string(p.detections.size()) + ","
               "\"status\":" + to_json(st) +
               "}";
    }
}
