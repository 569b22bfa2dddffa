#pragma once

#include <memory>

#include <common/config.hpp>
#include <ingest/frame_source.hpp>

namespace shelf {
    std::string build_gst_pipeline(const SourceConfig& cfg, const std::string& sink_name);

    std::unique_ptr<IFrameSource> make_frame_source(const SourceConfig& cfg);
}
