#include <inventory/delta_batcher.hpp>

#include <iostream>
#include <utility>

namespace shelf {
    DeltaBatcher::DeltaBatcher(std::string machine_id, std::chrono::milliseconds reconcile_window)
        : machine_id_(std::move(machine_id)),
          reconcile_window_(reconcile_window) {}

    void DeltaBatcher::append(const std::vector<InventoryEvent>& events, const Counts& counts) {
        std::lock_guard lk(mtx_);
        pending_.insert(pending_.end(), events.begin(), events.end());
        counts_ = counts;
    }

    void DeltaBatcher::append(const std::vector<InventoryEvent>& events) {
        if (events.empty()) return;
        std::lock_guard lk(mtx_);
        pending_.insert(pending_.end(), events.begin(), events.end());
    }

    void DeltaBatcher::update_counts(const Counts& counts) {
        std::lock_guard lk(mtx_);
        counts_ = counts;
    }

    InventoryDelta DeltaBatcher::drain() {
        InventoryDelta delta;
        delta.machine_id = machine_id_;
        std::chrono::milliseconds window{0};
        {
            std::lock_guard lk(mtx_);
            delta.events.swap(pending_);
            delta.counts = counts_;
            window = reconcile_window_;
        }
        delta.timestamp = Clock::now();

        if (window.count() > 0 && delta.events.size() >= 2) reconcile_(delta.events, window);
        return delta;
    }

    size_t DeltaBatcher::pending_size() const {
        std::lock_guard lk(mtx_);
        return pending_.size();
    }

    Counts DeltaBatcher::counts() const {
        std::lock_guard lk(mtx_);
        return counts_;
    }

    void DeltaBatcher::set_reconcile_window(std::chrono::milliseconds window) {
        std::lock_guard lk(mtx_);
        reconcile_window_ = window.count() < 0 ? std::chrono::milliseconds(0) : window;
    }

    // A tracker that loses identity reports Taken for the old id and Added for
    // a new one. Pair them up per item when they are close in time.
    void DeltaBatcher::reconcile_(std::vector<InventoryEvent>& events, std::chrono::milliseconds window) {
        std::vector<char> dropped(events.size(), 0);
        size_t cancelled = 0;

        for (size_t i = 0; i < events.size(); ++i) {
            if (dropped[i] || events[i].type != EventType::Taken) continue;

            for (size_t j = 0; j < events.size(); ++j) {
                if (dropped[j] || events[j].type != EventType::Added) continue;
                if (events[j].item != events[i].item || events[j].track_id == events[i].track_id) continue;

                const auto dt = events[i].timestamp > events[j].timestamp
                                    ? events[i].timestamp - events[j].timestamp
                                    : events[j].timestamp - events[i].timestamp;
                if (dt > window) continue;

                dropped[i] = 1;
                dropped[j] = 1;
                ++cancelled;
                break;
            }
        }

        if (cancelled == 0) return;

        std::vector<InventoryEvent> kept;
        kept.reserve(events.size() - 2 * cancelled);
        for (size_t i = 0; i < events.size(); ++i) {
            if (!dropped[i]) kept.push_back(std::move(events[i]));
        }
        events.swap(kept);
        std::cout << "[DeltaBatcher](drain) reconciled " << cancelled << " taken/added pair(s)\n";
    }

    void merge_delta(InventoryDelta& undelivered, InventoryDelta next) {
        undelivered.events.insert(undelivered.events.end(),
                                  std::make_move_iterator(next.events.begin()),
                                  std::make_move_iterator(next.events.end()));
        undelivered.counts = std::move(next.counts);
        undelivered.timestamp = next.timestamp;
        if (undelivered.machine_id.empty()) undelivered.machine_id = std::move(next.machine_id);
    }
}
