#include <pipeline/inventory_pipeline.hpp>
#include <push/delta_pusher.hpp>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    // What the fake tracker returns next, and what it was given.
    struct Script {
        std::vector<shelf::TrackedDetection> next;
        bool fail = false;
        int calls = 0;
        cv::Size last_size;
    };

    class ScriptedTracking final : public shelf::ITrackingCapability {
    public:
        explicit ScriptedTracking(std::shared_ptr<Script> s) : s_(std::move(s)) {}

        std::vector<shelf::TrackedDetection> track(const cv::Mat& image) override {
            s_->calls += 1;
            s_->last_size = image.size();
            if (s_->fail) throw std::runtime_error("detector crashed");
            return s_->next;
        }

    private:
        std::shared_ptr<Script> s_;
    };

    class FlakySink final : public shelf::IDeltaSink {
    public:
        int fail_next = 0;
        bool on = true;
        int attempts = 0;
        std::vector<shelf::InventoryDelta> delivered;

        bool enabled() const override { return on; }

        bool push(const shelf::InventoryDelta& delta) override {
            ++attempts;
            if (fail_next > 0) {
                --fail_next;
                return false;
            }
            delivered.push_back(delta);
            return true;
        }
    };

    shelf::TrackedDetection det(int track_id, const std::string& name, float x = 0.0f, float y = 0.0f) {
        shelf::TrackedDetection d;
        d.track_id = track_id;
        d.class_name = name;
        d.confidence = 0.9f;
        d.bbox = shelf::Box{x, y, 10.0f, 10.0f};
        return d;
    }

    // Alternating black and white so the motion gate opens on every frame.
    cv::Mat moving_frame(int i) {
        const int v = (i % 2) ? 255 : 0;
        return cv::Mat(120, 160, CV_8UC3, cv::Scalar(v, v, v));
    }

    cv::Mat still_frame() {
        return cv::Mat(120, 160, CV_8UC3, cv::Scalar(60, 60, 60));
    }

    std::unique_ptr<shelf::InventoryPipeline> make_pipeline(std::shared_ptr<Script> script,
                                                            shelf::InventoryPipeline::Options opt = {}) {
        return std::make_unique<shelf::InventoryPipeline>(std::move(opt),
                                                          std::make_unique<ScriptedTracking>(std::move(script)));
    }

    void test_requires_tracking() {
        bool threw = false;
        try {
            shelf::InventoryPipeline p(shelf::InventoryPipeline::Options{}, nullptr);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "a pipeline without tracking should not be constructible");
    }

    void test_tracking_failure_keeps_inventory() {
        auto script = std::make_shared<Script>();
        shelf::InventoryPipeline::Options opt;
        opt.inventory.debounce_frames = 3;
        auto p = make_pipeline(script, opt);

        script->next = {det(1, "bottle")};
        const auto first = p->process_frame(moving_frame(0));
        check(first.events.size() == 1, "first sighting should add");

        script->fail = true;
        for (int i = 1; i <= 14; ++i) {
            const auto r = p->process_frame(moving_frame(i));
            check(r.tracking_failed, "a throwing tracker should be reported");
            check(r.events.empty(), "a tracking failure must not remove anything");
            check(r.detections.size() == 1, "a tracking failure should reuse the previous detections");
        }

        const auto st = p->status();
        check(st.inventory.at("bottle") == 1, "count should survive tracking failures");
        check(st.tracking_failures == 14, "every failure should be counted");
        check(st.frames_seen == 15, "every frame should be counted");
    }

    void test_static_scene_does_not_advance_removal() {
        auto script = std::make_shared<Script>();
        shelf::InventoryPipeline::Options opt;
        opt.inventory.debounce_frames = 2;
        auto p = make_pipeline(script, opt);

        script->next = {det(1, "chips")};
        (void)p->process_frame(still_frame());

        script->next.clear();
        for (int i = 0; i < 20; ++i) {
            const auto r = p->process_frame(still_frame());
            check(!r.inference_ran, "a static scene should skip inference");
            check(r.events.empty(), "a skipped frame should not emit events");
        }
        check(script->calls == 1, "the tracker should run only for the first frame");
        check(p->status().inventory.at("chips") == 1, "a static scene should keep the count");
        check(p->status().inference_runs == 1, "only one inference should be recorded");
    }

    void test_allowed_classes_filter() {
        auto script = std::make_shared<Script>();
        shelf::InventoryPipeline::Options opt;
        opt.allowed_classes = {"bottle"};
        auto p = make_pipeline(script, opt);

        script->next = {det(1, "bottle"), det(2, "person")};
        const auto r = p->process_frame(moving_frame(0));
        check(r.detections.size() == 1, "disallowed classes should be filtered out");
        check(r.events.size() == 1 && r.events[0].item == "bottle", "only allowed classes reach the inventory");

        p->set_allowed_classes({});
        script->next = {det(1, "bottle"), det(2, "person")};
        const auto r2 = p->process_frame(moving_frame(1));
        check(r2.events.size() == 1 && r2.events[0].item == "person", "an empty allow-list admits every class");
    }

    void test_process_every_n_frames() {
        auto script = std::make_shared<Script>();
        shelf::InventoryPipeline::Options opt;
        opt.process_every_n_frames = 3;
        auto p = make_pipeline(script, opt);

        std::vector<bool> processed;
        for (int i = 0; i < 6; ++i) processed.push_back(p->process_frame(moving_frame(i)).processed);
        check(!processed[0] && !processed[1] && processed[2], "frames 1-2 skipped, 3 processed");
        check(!processed[3] && !processed[4] && processed[5], "frames 4-5 skipped, 6 processed");
        check(p->status().frames_seen == 6 && p->status().frames_processed == 2, "status should count both");
    }

    void test_region_applies_on_next_frame() {
        auto script = std::make_shared<Script>();
        auto p = make_pipeline(script);

        check(p->set_region(shelf::Region{20, 10, 100, 90}), "a well-formed ROI should be accepted");
        check(!p->region().has_value(), "the ROI should not apply before the next frame");

        script->next = {det(1, "bottle", 5.0f, 6.0f)};
        const auto r = p->process_frame(moving_frame(0));
        check(script->last_size == cv::Size(80, 80), "the tracker should see only the ROI");
        check(p->region() && p->region()->x1 == 20, "the ROI should be in effect after the frame");
        if (!r.detections.empty()) {
            check(r.detections[0].bbox.x == 25.0f && r.detections[0].bbox.y == 16.0f,
                  "detections should come back in full-frame coordinates");
        }

        check(!p->set_region(shelf::Region{0, 0, 500, 500}), "an ROI larger than the frame should be rejected");
        (void)p->process_frame(moving_frame(1));
        check(p->region() && p->region()->x2 == 100, "a rejected ROI should keep the previous one");

        check(p->set_region(std::nullopt), "clearing the ROI should be accepted");
        (void)p->process_frame(moving_frame(2));
        check(!p->region().has_value(), "a cleared ROI should apply on the next frame");
        check(script->last_size == cv::Size(160, 120), "without ROI the tracker sees the full frame");
    }

    void test_configured_region_outside_frame_is_dropped() {
        auto script = std::make_shared<Script>();
        shelf::InventoryPipeline::Options opt;
        opt.privacy.roi = shelf::Region{1000, 1000, 1200, 1200};
        auto p = make_pipeline(script, opt);

        script->next = {det(1, "bottle", 5.0f, 6.0f)};
        const cv::Mat frame = moving_frame(0);
        const auto r = p->process_frame(frame);

        check(!p->region().has_value(), "a configured ROI outside the frame should be dropped");
        check(p->status().region_rejections == 1, "the dropped ROI should be reported in the status");
        check(script->last_size == frame.size(), "the tracker should see the full frame");
        check(r.detections.size() == 1, "the detection should survive");
        if (!r.detections.empty()) {
            const auto& b = r.detections[0].bbox;
            check(b.x == 5.0f && b.y == 6.0f, "the detection should not be shifted");
            check(b.x2() <= frame.cols && b.y2() <= frame.rows, "the detection should stay inside the frame");
        }

        cv::Mat noisy(120, 160, CV_8UC3);
        cv::RNG rng(7);
        rng.fill(noisy, cv::RNG::UNIFORM, 0, 256);
        const cv::Mat ui = p->projector().render_for_display(noisy, opt.privacy.roi);
        cv::Mat diff;
        cv::absdiff(ui, noisy, diff);
        check(cv::countNonZero(diff.reshape(1)) > 0, "rendering with the missed ROI should blur the frame");
    }

    void test_region_rejected_on_first_frame_is_reported() {
        auto script = std::make_shared<Script>();
        auto p = make_pipeline(script);

        check(p->set_region(shelf::Region{0, 0, 500, 500}), "before any frame only the shape can be checked");
        check(p->status().region_rejections == 0, "nothing is rejected yet");

        (void)p->process_frame(moving_frame(0));
        check(!p->region().has_value(), "a ROI larger than the first frame should not apply");
        check(p->status().region_rejections == 1, "the deferred rejection should be visible in the status");
        check(script->last_size == cv::Size(160, 120), "the tracker should see the full frame");

        check(!p->set_region(shelf::Region{0, 0, 500, 500}), "once the frame size is known the setter rejects directly");
    }

    void test_runtime_setters_validate() {
        auto script = std::make_shared<Script>();
        auto p = make_pipeline(script);
        check(!p->set_motion_threshold(2.0f), "motion threshold above 1 should be rejected");
        check(p->set_motion_threshold(0.5f), "motion threshold 0.5 should be accepted");
        check(!p->set_debounce_threshold(0), "debounce 0 should be rejected");
        check(p->set_debounce_threshold(5), "debounce 5 should be accepted");
    }

    void test_disabled_sink_does_not_accumulate() {
        auto script = std::make_shared<Script>();
        auto p = make_pipeline(script);
        FlakySink sink;
        sink.on = false;
        shelf::DeltaForwarder forwarder(p->batcher(), sink);

        for (int i = 0; i < 20; ++i) {
            script->next = {det(i + 1, "soda", 10.0f * i, 0.0f)};
            (void)p->process_frame(moving_frame(i));
            check(!forwarder.forward_once(), "a disabled sink delivers nothing");
            check(!forwarder.has_undelivered(), "a disabled sink should not build up a backlog");
            check(p->batcher().pending_size() == 0, "the batcher should still be drained");
        }
        check(sink.attempts == 0, "a disabled sink should never be called");
    }

    void test_undelivered_delta_is_retried() {
        auto script = std::make_shared<Script>();
        auto p = make_pipeline(script);
        FlakySink sink;
        sink.fail_next = 1;
        shelf::DeltaForwarder forwarder(p->batcher(), sink);

        script->next = {det(1, "soda")};
        (void)p->process_frame(moving_frame(0));
        check(!forwarder.forward_once(), "a refused push should report failure");
        check(forwarder.has_undelivered() && forwarder.undelivered_events() == 1, "a refused delta should be kept");

        script->next = {det(1, "soda"), det(2, "soda", 50.0f, 50.0f)};
        (void)p->process_frame(moving_frame(1));
        check(forwarder.forward_once(), "the next push should succeed");
        check(sink.delivered.size() == 1, "one delta should be delivered");
        if (!sink.delivered.empty()) {
            const auto& d = sink.delivered[0];
            check(d.events.size() == 2, "the retried delta should carry both events");
            check(d.counts.at("soda") == 2, "the retried delta should carry the latest counts");
        }
        check(!forwarder.has_undelivered(), "nothing should be left after a successful push");

        check(!forwarder.forward_once(), "nothing new means nothing to push");
        check(sink.delivered.size() == 1, "an unchanged inventory should not be pushed again");
    }
}

int main() {
    test_requires_tracking();
    test_tracking_failure_keeps_inventory();
    test_static_scene_does_not_advance_removal();
    test_allowed_classes_filter();
    test_process_every_n_frames();
    test_region_applies_on_next_frame();
    test_configured_region_outside_frame_is_dropped();
    test_region_rejected_on_first_frame_is_reported();
    test_runtime_setters_validate();
    test_undelivered_delta_is_retried();
    test_disabled_sink_does_not_accumulate();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all pipeline tests passed\n";
    return 0;
}
