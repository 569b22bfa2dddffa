#pragma once

#include <string>

#include <ingest/frame_packet.hpp>

namespace shelf {
    // Pull-based camera abstraction. The pipeline consumes frames but never
    // owns the capture device beyond start/stop.
    struct IFrameSource {
        virtual ~IFrameSource() = default;
        virtual bool start() = 0;
        virtual void stop() = 0;
        virtual bool read(FramePacket& out, int timeout_ms) = 0;
        virtual const std::string& id() const = 0;
    };
}
