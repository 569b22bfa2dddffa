#include <inventory/delta_json.hpp>

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace shelf {
    const char* to_wire(EventType t) {
        switch (t) {
            case EventType::Added: return "SNACK_ADDED";
            case EventType::Taken: return "SNACK_TAKEN";
        }
        return "UNKNOWN";
    }

    std::string format_iso8601(Clock::time_point tp) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
        const std::time_t secs = static_cast<std::time_t>(ms / 1000);
        const int millis = static_cast<int>(ms % 1000);

        std::tm utc{};
        gmtime_r(&secs, &utc);

        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                      utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                      utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
        return buf;
    }

    std::string json_escape(const std::string& s) {
        std::string out;
        out.reserve(s.size() + 2);
        for (const char c : s) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                        out += buf;
                    } else {
                        out += c;
                    }
            }
        }
        return out;
    }

    std::string to_json(const InventoryEvent& e) {
        return "{"
               "\"type\":\"" + std::string(to_wire(e.type)) + "\","
               "\"item\":\"" + json_escape(e.item) + "\","
               "\"timestamp\":\"" + format_iso8601(e.timestamp) + "\","
               "\"track_id\":" + std::to_string(e.track_id) + ","
               "\"count_before\":" + std::to_string(e.count_before) + ","
               "\"count_after\":" + std::to_string(e.count_after) +
               "}";
    }

    std::string to_json(const Counts& counts) {
        std::ostringstream oss;
        oss << "{";
        size_t i = 0;
        for (const auto& kv : counts) {
            oss << "\"" << json_escape(kv.first) << "\":" << kv.second;
            if (++i < counts.size()) oss << ",";
        }
        oss << "}";
        return oss.str();
    }

    std::string to_json(const InventoryDelta& d) {
        std::ostringstream oss;
        oss << "{"
            << "\"machine_id\":\"" << json_escape(d.machine_id) << "\","
            << "\"timestamp\":\"" << format_iso8601(d.timestamp) << "\","
            << "\"items\":{";
        size_t i = 0;
        for (const auto& kv : d.counts) {
            oss << "\"" << json_escape(kv.first) << "\":{\"count\":" << kv.second << ",\"confidence\":1.0}";
            if (++i < d.counts.size()) oss << ",";
        }
        oss << "},\"events\":[";
        for (size_t k = 0; k < d.events.size(); ++k) {
            oss << to_json(d.events[k]);
            if (k + 1 < d.events.size()) oss << ",";
        }
        oss << "]}";
        return oss.str();
    }

    std::string to_json(const PipelineStatus& s) {
        std::ostringstream oss;
        oss << "{"
            << "\"status\":\"" << json_escape(s.state) << "\","
            << "\"fps\":" << std::fixed << std::setprecision(1) << s.fps << ","
            << "\"frame_count\":" << s.frames_seen << ","
            << "\"frames_processed\":" << s.frames_processed << ","
            << "\"inference_runs\":" << s.inference_runs << ","
            << "\"tracking_failures\":" << s.tracking_failures << ","
            << "\"region_rejections\":" << s.region_rejections << ","
            << "\"motion_active\":" << (s.motion_active ? "true" : "false") << ","
            << "\"motion_score\":" << std::setprecision(4) << s.motion_score << ","
            << "\"last_detection_time\":";
        if (s.last_detection_time) {
            oss << "\"" << format_iso8601(*s.last_detection_time) << "\"";
        } else {
            oss << "null";
        }
        oss << ",\"inventory\":" << to_json(s.inventory) << "}";
        return oss.str();
    }
}
