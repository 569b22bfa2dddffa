#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include <pipeline/types.hpp>

namespace shelf {
    // Hand-off point between the processing thread (append) and the delta
    // consumer (drain). The mutex is held only while copying/swapping.
    class DeltaBatcher {
    public:
        explicit DeltaBatcher(std::string machine_id,
                              std::chrono::milliseconds reconcile_window = std::chrono::milliseconds(0));

        // Adds events and refreshes the counts snapshot in one step, so a
        // drain never sees events without the counts they produced.
        void append(const std::vector<InventoryEvent>& events, const Counts& counts);
        void append(const std::vector<InventoryEvent>& events);
        void update_counts(const Counts& counts);

        // Always returns a delta carrying the current counts. An empty event
        // list means nothing changed since the previous drain.
        InventoryDelta drain();

        size_t pending_size() const;
        Counts counts() const;

        void set_reconcile_window(std::chrono::milliseconds window);

    private:
        static void reconcile_(std::vector<InventoryEvent>& events, std::chrono::milliseconds window);

        const std::string machine_id_;

        mutable std::mutex mtx_;
        std::vector<InventoryEvent> pending_;
        Counts counts_;
        std::chrono::milliseconds reconcile_window_{0};
    };

    // Folds a newer drain into an undelivered one: events stay in order,
    // counts and timestamp come from the newer delta.
    void merge_delta(InventoryDelta& undelivered, InventoryDelta next);
}
