#include <inventory/state_machine.hpp>

#include <algorithm>
#include <iostream>
#include <unordered_set>

namespace shelf {
    InventoryStateMachine::InventoryStateMachine(InventoryConfig cfg) {
        if (!set_debounce_threshold(cfg.debounce_frames)) {
            debounce_frames_ = InventoryConfig{}.debounce_frames;
        }
        set_baseline(cfg.baseline);
    }

    bool InventoryStateMachine::set_debounce_threshold(int frames) {
        if (frames < 1) {
            std::cerr << "[Inventory](set_debounce_threshold) rejected " << frames
                      << ", must be >= 1\n";
            return false;
        }
        debounce_frames_ = frames;
        return true;
    }

    void InventoryStateMachine::set_baseline(const Counts& baseline) {
        counts_.clear();
        for (const auto& kv : baseline) {
            counts_[kv.first] = std::max(0, kv.second);
        }
        for (const auto& kv : tracks_) {
            counts_[kv.second.class_name] += 1;
        }
    }

    int InventoryStateMachine::count(const std::string& item) const {
        auto it = counts_.find(item);
        return it == counts_.end() ? 0 : it->second;
    }

    size_t InventoryStateMachine::active_tracks() const {
        return static_cast<size_t>(std::count_if(tracks_.begin(),
                                                 tracks_.end(),
                                                 [](const auto& kv) { return kv.second.active(); }));
    }

    void InventoryStateMachine::reset() {
        counts_.clear();
        tracks_.clear();
    }

    InventoryEvent InventoryStateMachine::make_event_(EventType type,
                                                      const std::string& item,
                                                      int track_id,
                                                      int before,
                                                      int after,
                                                      Clock::time_point now) const {
        InventoryEvent e;
        e.type = type;
        e.item = item;
        e.timestamp = now;
        e.track_id = track_id;
        e.count_before = before;
        e.count_after = after;

        std::cout << "[Inventory] " << to_wire(type) << ": " << item
                  << " (track_id=" << track_id << ", count: " << before << " -> " << after << ")\n";
        return e;
    }

    std::vector<InventoryEvent> InventoryStateMachine::update(const std::vector<TrackedDetection>& detections) {
        std::vector<InventoryEvent> events;
        const auto now = Clock::now();

        std::unordered_set<int> seen;
        seen.reserve(detections.size());

        for (const auto& det : detections) {
            if (!seen.insert(det.track_id).second) continue;

            auto it = tracks_.find(det.track_id);
            if (it != tracks_.end()) {
                it->second.missing_count = 0;
                continue;
            }

            tracks_.emplace(det.track_id, TrackState{det.class_name, 0});
            int& count = counts_[det.class_name];
            const int before = count;
            count += 1;
            events.push_back(make_event_(EventType::Added, det.class_name, det.track_id, before, count, now));
        }

        for (auto it = tracks_.begin(); it != tracks_.end();) {
            if (seen.count(it->first) != 0) {
                ++it;
                continue;
            }

            it->second.missing_count += 1;
            if (it->second.missing_count < debounce_frames_) {
                ++it;
                continue;
            }

            int& count = counts_[it->second.class_name];
            const int before = count;
            count = std::max(0, count - 1);
            events.push_back(make_event_(EventType::Taken, it->second.class_name, it->first, before, count, now));
            it = tracks_.erase(it);
        }

        return events;
    }
}
