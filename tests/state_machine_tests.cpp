#include <inventory/state_machine.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    shelf::TrackedDetection det(int track_id, const std::string& name) {
        shelf::TrackedDetection d;
        d.track_id = track_id;
        d.class_name = name;
        d.confidence = 0.9f;
        d.bbox = shelf::Box{10.0f, 10.0f, 40.0f, 80.0f};
        return d;
    }

    shelf::InventoryStateMachine make_sm(int debounce, shelf::Counts baseline = {}) {
        shelf::InventoryConfig cfg;
        cfg.debounce_frames = debounce;
        cfg.baseline = std::move(baseline);
        return shelf::InventoryStateMachine(cfg);
    }

    void test_first_sighting_adds_immediately() {
        auto sm = make_sm(10);
        const auto events = sm.update({det(1, "bottle")});

        check(events.size() == 1, "first sighting should emit one event");
        if (events.size() != 1) return;
        check(events[0].type == shelf::EventType::Added, "first sighting should be Added");
        check(events[0].item == "bottle", "Added event should carry the class name");
        check(events[0].track_id == 1, "Added event should carry the track id");
        check(events[0].count_before == 0 && events[0].count_after == 1, "Added should go 0 -> 1");
        check(sm.count("bottle") == 1, "count should be 1 after one addition");
    }

    void test_seen_track_does_not_add_again() {
        auto sm = make_sm(10);
        (void)sm.update({det(1, "bottle")});
        for (int i = 0; i < 5; ++i) {
            check(sm.update({det(1, "bottle")}).empty(), "a track that stays visible emits nothing");
        }
        check(sm.count("bottle") == 1, "count should stay at 1 while the track is visible");
    }

    void test_removal_waits_for_debounce() {
        auto sm = make_sm(3);
        (void)sm.update({det(1, "chips")});

        check(sm.update({}).empty(), "1st absence should not remove");
        check(sm.update({}).empty(), "2nd absence should not remove");
        const auto events = sm.update({});

        check(events.size() == 1, "3rd absence should emit exactly one event");
        if (events.size() != 1) return;
        check(events[0].type == shelf::EventType::Taken, "removal should be Taken");
        check(events[0].count_before == 1 && events[0].count_after == 0, "Taken should go 1 -> 0");
        check(sm.tracks().empty(), "a taken track should be forgotten");
    }

    void test_reappearance_resets_debounce() {
        auto sm = make_sm(3);
        (void)sm.update({det(7, "candy")});
        (void)sm.update({});
        (void)sm.update({});

        const auto back = sm.update({det(7, "candy")});
        check(back.empty(), "a track coming back before the threshold emits nothing");
        check(sm.tracks().at(7).active(), "a returning track should be active again");

        check(sm.update({}).empty(), "absence counter should restart from 0 (1)");
        check(sm.update({}).empty(), "absence counter should restart from 0 (2)");
        check(sm.update({}).size() == 1, "3 consecutive absences after return should remove");
    }

    void test_duplicate_ids_in_one_frame_count_once() {
        auto sm = make_sm(10);
        const auto events = sm.update({det(4, "bottle"), det(4, "bottle")});
        check(events.size() == 1, "duplicate track ids in one frame should add once");
        check(sm.count("bottle") == 1, "duplicate track ids should count once");
    }

    void test_simultaneous_removals_ordered_by_track_id() {
        auto sm = make_sm(1);
        (void)sm.update({det(9, "a"), det(2, "b"), det(5, "c")});
        const auto events = sm.update({});

        check(events.size() == 3, "all three tracks should be taken at once");
        if (events.size() != 3) return;
        check(events[0].track_id == 2 && events[1].track_id == 5 && events[2].track_id == 9,
              "simultaneous removals should come out in ascending track id order");
    }

    void test_counts_never_negative() {
        auto sm = make_sm(1, {{"soda", 0}});
        (void)sm.update({det(1, "soda")});
        sm.set_baseline({{"soda", -3}});
        check(sm.count("soda") == 1, "baseline is clamped at 0 and live tracks are added on top");

        const auto events = sm.update({});
        check(events.size() == 1, "track should be taken with debounce 1");
        for (const auto& kv : sm.counts()) {
            check(kv.second >= 0, "no count may go negative: " + kv.first);
        }
    }

    void test_baseline_scenario() {
        // Shelf starts with 4 chips; a fifth is tracked for 50 frames and then
        // disappears for 10.
        auto sm = make_sm(10, {{"chips", 4}});
        check(sm.count("chips") == 4, "baseline should be visible before any frame");

        std::vector<shelf::InventoryEvent> all;
        for (int frame = 1; frame <= 50; ++frame) {
            const auto ev = sm.update({det(3, "chips")});
            all.insert(all.end(), ev.begin(), ev.end());
        }
        check(all.size() == 1, "exactly one Added during the visible period");
        if (!all.empty()) {
            check(all[0].count_before == 4 && all[0].count_after == 5, "Added should go 4 -> 5");
        }

        for (int frame = 51; frame <= 59; ++frame) {
            check(sm.update({}).empty(), "no removal before the 10th absence (frame " + std::to_string(frame) + ")");
        }
        const auto taken = sm.update({});
        check(taken.size() == 1, "removal should fire on frame 60");
        if (!taken.empty()) {
            check(taken[0].type == shelf::EventType::Taken, "frame 60 event should be Taken");
            check(taken[0].count_before == 5 && taken[0].count_after == 4, "Taken should go 5 -> 4");
        }
        check(sm.count("chips") == 4, "final count should be back to 4");
    }

    void test_rejects_zero_debounce() {
        auto sm = make_sm(5);
        check(!sm.set_debounce_threshold(0), "debounce of 0 should be rejected");
        check(sm.debounce_threshold() == 5, "rejected debounce should keep the previous value");
        check(sm.set_debounce_threshold(2), "debounce of 2 should be accepted");
        check(sm.debounce_threshold() == 2, "accepted debounce should take effect");
    }

    void test_reset_clears_everything() {
        auto sm = make_sm(5, {{"chips", 2}});
        (void)sm.update({det(1, "chips")});
        sm.reset();
        check(sm.counts().empty(), "reset should clear counts");
        check(sm.tracks().empty(), "reset should clear tracks");
        check(sm.active_tracks() == 0, "reset should leave no active tracks");
    }
}

int main() {
    test_first_sighting_adds_immediately();
    test_seen_track_does_not_add_again();
    test_removal_waits_for_debounce();
    test_reappearance_resets_debounce();
    test_duplicate_ids_in_one_frame_count_once();
    test_simultaneous_removals_ordered_by_track_id();
    test_counts_never_negative();
    test_baseline_scenario();
    test_rejects_zero_debounce();
    test_reset_clears_everything();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all state machine tests passed\n";
    return 0;
}
