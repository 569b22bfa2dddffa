#pragma once

#include <string>

#include <pipeline/types.hpp>

namespace shelf {
    // UTC, millisecond precision: 2026-01-01T12:00:00.000Z
    std::string format_iso8601(Clock::time_point tp);

    std::string json_escape(const std::string& s);

    std::string to_json(const InventoryEvent& e);
    std::string to_json(const Counts& counts);

    // Body of POST /inventory/update: items as {count, confidence}.
    std::string to_json(const InventoryDelta& d);

    std::string to_json(const PipelineStatus& s);
}
