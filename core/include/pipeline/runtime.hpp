#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <encode/preview_server.hpp>
#include <ingest/frame_source.hpp>
#include <pipeline/inventory_pipeline.hpp>
#include <push/delta_pusher.hpp>

#include <pipeline/types.hpp>
#include <pipeline/preview_mailbox.hpp>

namespace shelf {
    class PipelineRuntime {
    public:
        struct Options {
            std::string stream_id = "cam0";
            int jpeg_quality = 75;
            int read_timeout_ms = 100;
            size_t preview_cap = 2;
            std::chrono::milliseconds batch_interval{1000};
        };

        PipelineRuntime(PreviewServer& server,
                        InventoryPipeline& pipeline,
                        IDeltaSink& sink,
                        std::unique_ptr<IFrameSource> source,
                        Options opt);

        bool start();
        void stop();

        ~PipelineRuntime() { stop(); }
    private:
        // workers
        void process_loop_();
        void push_loop_();
        void encoder_loop_();

        cv::Mat render_preview_(const PreviewFrame& p) const;
        std::string preview_status_(const PreviewFrame& p, const cv::Mat& ui) const;

        PreviewServer& server_;
        InventoryPipeline& pipeline_;
        std::unique_ptr<IFrameSource> source_;
        Options opt_;

        std::atomic<bool> running_{false};

        PreviewMailbox<PreviewPtr> preview_in_;
        DeltaForwarder forwarder_;

        std::mutex push_mtx_;
        std::condition_variable push_cv_;

        std::thread process_thr_;
        std::thread push_thr_;
        std::thread enc_thr_;
    };
}
