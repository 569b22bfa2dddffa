#include <inventory/delta_json.hpp>

#include <chrono>
#include <iostream>
#include <string>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    shelf::Clock::time_point at_ms(long long ms) {
        return shelf::Clock::time_point(std::chrono::milliseconds(ms));
    }

    void test_iso8601_is_utc_millis() {
        check(shelf::format_iso8601(at_ms(1234)) == "1970-01-01T00:00:01.234Z", "epoch + 1.234s");
        check(shelf::format_iso8601(at_ms(1767268800000LL)) == "2026-01-01T12:00:00.000Z", "2026-01-01 noon UTC");
    }

    void test_escape() {
        check(shelf::json_escape("a\"b") == "a\\\"b", "quotes should be escaped");
        check(shelf::json_escape("a\\b") == "a\\\\b", "backslashes should be escaped");
        check(shelf::json_escape("a\nb") == "a\\nb", "newlines should be escaped");
        check(shelf::json_escape(std::string("a\x01") + "b") == "a\\u0001b", "control chars should be \\u escaped");
        check(shelf::json_escape("plain") == "plain", "plain text is unchanged");
    }

    void test_event_json() {
        shelf::InventoryEvent e;
        e.type = shelf::EventType::Taken;
        e.item = "chips";
        e.track_id = 3;
        e.count_before = 5;
        e.count_after = 4;
        e.timestamp = at_ms(1234);

        const std::string json = shelf::to_json(e);
        check(contains(json, "\"type\":\"SNACK_TAKEN\""), "event type should use the wire name");
        check(contains(json, "\"item\":\"chips\""), "event should carry the item");
        check(contains(json, "\"timestamp\":\"1970-01-01T00:00:01.234Z\""), "event timestamp should be ISO 8601");
        check(contains(json, "\"count_before\":5") && contains(json, "\"count_after\":4"), "event should carry both counts");
    }

    void test_delta_json() {
        shelf::InventoryDelta d;
        d.machine_id = "edge-7";
        d.timestamp = at_ms(0);
        d.counts = {{"chips", 4}, {"soda", 0}};

        const std::string json = shelf::to_json(d);
        check(contains(json, "\"machine_id\":\"edge-7\""), "delta should carry the machine id");
        check(contains(json, "\"items\":{\"chips\":{\"count\":4,\"confidence\":1.0},\"soda\":{\"count\":0,\"confidence\":1.0}}"),
              "items should be {count, confidence} per label");
        check(contains(json, "\"events\":[]"), "a delta without events should carry an empty list");
    }

    void test_status_json() {
        shelf::PipelineStatus s;
        s.state = "running";
        s.frames_seen = 12;
        s.inventory = {{"chips", 2}};

        std::string json = shelf::to_json(s);
        check(contains(json, "\"status\":\"running\""), "status should carry the state");
        check(contains(json, "\"frame_count\":12"), "status should carry the frame count");
        check(contains(json, "\"last_detection_time\":null"), "no detection yet should be null");
        check(contains(json, "\"inventory\":{\"chips\":2}"), "status should carry the inventory");

        s.last_detection_time = at_ms(1234);
        json = shelf::to_json(s);
        check(contains(json, "\"last_detection_time\":\"1970-01-01T00:00:01.234Z\""), "detection time should be ISO 8601");
    }
}

int main() {
    test_iso8601_is_utc_millis();
    test_escape();
    test_event_json();
    test_delta_json();
    test_status_json();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all delta json tests passed\n";
    return 0;
}
