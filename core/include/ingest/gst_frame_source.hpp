#pragma once

#include <ingest/frame_source.hpp>
#include <string>

struct _GstElement;
using GstElement = _GstElement;
struct _GstSample;
using GstSample = _GstSample;

namespace shelf {
    // BGR frames from a gst-launch description ending in a named appsink.
    class GstFrameSource: public IFrameSource {
    public:
        // loop: seek back to the start on end-of-stream (file sources).
        GstFrameSource(std::string pipeline, std::string src_id, std::string sink_name, bool loop = false);

        bool start() override;
        void stop() override;
        bool read(FramePacket& out, int timeout_ms = 1000) override;
        const std::string& id() const override { return id_; }

        ~GstFrameSource() override;

    private:
        bool build_pipeline_();
        bool attach_sink_();
        bool rewind_();
        bool to_packet_(GstSample* sample, FramePacket& out);

        std::string description_;
        std::string id_;
        std::string sink_name_;
        bool loop_ = false;

        GstElement* pipeline_ = nullptr;
        GstElement* sink_ = nullptr;

        int64_t frame_id_ = 0;
        int64_t rewinds_ = 0;
        bool eos_reported_ = false;
    };
}
