#pragma once

#include <map>
#include <string>
#include <vector>

#include <pipeline/types.hpp>

namespace shelf {
    struct InventoryConfig {
        // Consecutive updates a track must be absent before it counts as taken.
        int debounce_frames = 10;

        // Items already on the shelf before the first frame.
        Counts baseline;
    };

    // Turns per-frame tracked detections into Added/Taken events.
    //
    // Additions fire on first sight of a track id. Removals are debounced: a
    // track must be missing for debounce_frames consecutive updates. Each track
    // id lives in one map entry whose missing_count is 0 while it is Active and
    // k while it is Missing(k); the entry is erased when the Taken event fires.
    //
    // Not thread-safe: owned by the processing thread.
    class InventoryStateMachine {
    public:
        struct TrackState {
            std::string class_name;
            int missing_count = 0;

            bool active() const { return missing_count == 0; }
        };

        explicit InventoryStateMachine(InventoryConfig cfg = {});

        std::vector<InventoryEvent> update(const std::vector<TrackedDetection>& detections);

        bool set_debounce_threshold(int frames);
        int debounce_threshold() const { return debounce_frames_; }

        // Replaces the externally known stock; live tracks are added on top.
        void set_baseline(const Counts& baseline);

        const Counts& counts() const { return counts_; }
        int count(const std::string& item) const;

        const std::map<int, TrackState>& tracks() const { return tracks_; }
        size_t active_tracks() const;

        void reset();

    private:
        InventoryEvent make_event_(EventType type,
                                   const std::string& item,
                                   int track_id,
                                   int before,
                                   int after,
                                   Clock::time_point now) const;

        int debounce_frames_ = 10;
        Counts counts_;
        std::map<int, TrackState> tracks_;
    };
}
