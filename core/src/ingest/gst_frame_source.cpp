#include <ingest/gst_frame_source.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <gst/video/video.h>
#include <opencv2/core.hpp>
#include <iostream>
#include <memory>
#include <mutex>

namespace shelf {
    namespace {
        struct SampleUnref {
            void operator()(GstSample* s) const { gst_sample_unref(s); }
        };
        using SamplePtr = std::unique_ptr<GstSample, SampleUnref>;

        // Read mapping of a buffer, released on scope exit.
        class MappedBuffer {
        public:
            explicit MappedBuffer(GstBuffer* buf) : buf_(buf) {
                ok_ = buf_ && gst_buffer_map(buf_, &info_, GST_MAP_READ);
            }
            ~MappedBuffer() {
                if (ok_) gst_buffer_unmap(buf_, &info_);
            }
            MappedBuffer(const MappedBuffer&) = delete;
            MappedBuffer& operator=(const MappedBuffer&) = delete;

            bool ok() const { return ok_ && info_.data && info_.size > 0; }
            const GstMapInfo& info() const { return info_; }

        private:
            GstBuffer* buf_;
            GstMapInfo info_{};
            bool ok_ = false;
        };

        void ensure_gst_init() {
            static std::once_flag flag;
            std::call_once(flag, [] { gst_init(nullptr, nullptr); });
        }
    } // namespace

    GstFrameSource::GstFrameSource(std::string pipeline, std::string id, std::string sink_name, bool loop)
        : description_(std::move(pipeline)),
          id_(std::move(id)),
          sink_name_(std::move(sink_name)),
          loop_(loop) {}

    GstFrameSource::~GstFrameSource() {
        stop();
    }

    bool GstFrameSource::start() {
        if (pipeline_) return true;
        ensure_gst_init();

        if (!build_pipeline_() || !attach_sink_()) {
            stop();
            return false;
        }

        if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[Ingest](start) " << id_ << ": pipeline refused PLAYING\n";
            stop();
            return false;
        }

        std::cout << "[Ingest](start) " << id_ << " playing" << (loop_ ? " (looped)" : "") << "\n";
        return true;
    }

    bool GstFrameSource::build_pipeline_() {
        GError* err = nullptr;
        pipeline_ = gst_parse_launch(description_.c_str(), &err);

        const std::string msg = err ? err->message : "";
        if (err) g_error_free(err);

        if (!pipeline_) {
            std::cerr << "[Ingest](start) " << id_ << ": cannot parse pipeline: "
                      << (msg.empty() ? "unknown error" : msg) << "\n";
            return false;
        }
        // A non-fatal parse error still yields a usable pipeline.
        if (!msg.empty()) {
            std::cerr << "[Ingest](start) " << id_ << ": pipeline warning: " << msg << "\n";
        }
        return true;
    }

    bool GstFrameSource::attach_sink_() {
        sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), sink_name_.c_str());
        if (!sink_ || !GST_IS_APP_SINK(sink_)) {
            std::cerr << "[Ingest](start) " << id_ << ": no appsink named '" << sink_name_ << "'\n";
            return false;
        }

        // Keep only the freshest frames; the pipeline thread never waits on us.
        GstAppSink* app = GST_APP_SINK(sink_);
        gst_app_sink_set_emit_signals(app, FALSE);
        gst_app_sink_set_max_buffers(app, 2);
        gst_app_sink_set_drop(app, TRUE);
        return true;
    }

    bool GstFrameSource::read(FramePacket& out, int timeout_ms) {
        if (!sink_) return false;
        GstAppSink* app = GST_APP_SINK(sink_);

        SamplePtr sample(gst_app_sink_try_pull_sample(app, static_cast<GstClockTime>(timeout_ms) * GST_MSECOND));
        if (sample) return to_packet_(sample.get(), out);

        if (gst_app_sink_is_eos(app)) {
            if (loop_) {
                rewind_();
            } else if (!eos_reported_) {
                std::cerr << "[Ingest](read) " << id_ << ": end of stream\n";
                eos_reported_ = true;
            }
        }
        return false;
    }

    bool GstFrameSource::to_packet_(GstSample* sample, FramePacket& out) {
        GstCaps* caps = gst_sample_get_caps(sample);
        GstVideoInfo vinfo;
        if (!caps || !gst_video_info_from_caps(&vinfo, caps)) return false;
        if (GST_VIDEO_INFO_FORMAT(&vinfo) != GST_VIDEO_FORMAT_BGR) {
            std::cerr << "[Ingest](read) " << id_ << ": expected BGR, got "
                      << gst_video_format_to_string(GST_VIDEO_INFO_FORMAT(&vinfo)) << "\n";
            return false;
        }

        const int w = GST_VIDEO_INFO_WIDTH(&vinfo);
        const int h = GST_VIDEO_INFO_HEIGHT(&vinfo);
        const int stride = GST_VIDEO_INFO_PLANE_STRIDE(&vinfo, 0);
        if (w <= 0 || h <= 0 || stride < w * 3) return false;

        GstBuffer* buf = gst_sample_get_buffer(sample);
        MappedBuffer mapped(buf);
        if (!mapped.ok()) return false;
        if (mapped.info().size < static_cast<size_t>(stride) * static_cast<size_t>(h)) return false;

        // The mapping dies with this scope, so the frame is deep-copied.
        out.bgr = cv::Mat(h, w, CV_8UC3, mapped.info().data, static_cast<size_t>(stride)).clone();
        out.pts_ns = GST_BUFFER_PTS_IS_VALID(buf) ? static_cast<int64_t>(GST_BUFFER_PTS(buf)) : 0;
        eos_reported_ = false;
        out.frame_id = frame_id_++;
        return true;
    }

    bool GstFrameSource::rewind_() {
        const auto flags = static_cast<GstSeekFlags>(GST_SEEK_FLAG_FLUSH | GST_SEEK_FLAG_KEY_UNIT);
        if (!pipeline_ || !gst_element_seek_simple(pipeline_, GST_FORMAT_TIME, flags, 0)) {
            std::cerr << "[Ingest](rewind) " << id_ << ": seek to start failed\n";
            return false;
        }
        ++rewinds_;
        std::cout << "[Ingest](rewind) " << id_ << ": loop " << rewinds_ << "\n";
        return true;
    }

    void GstFrameSource::stop() {
        if (!pipeline_) return;
        gst_element_set_state(pipeline_, GST_STATE_NULL);
        if (sink_) gst_object_unref(sink_);
        gst_object_unref(pipeline_);
        sink_ = nullptr;
        pipeline_ = nullptr;
    }
}
