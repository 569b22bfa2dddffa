#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <common/config.hpp>
#include <inventory/delta_batcher.hpp>
#include <pipeline/types.hpp>

namespace shelf {
    class IDeltaSink {
    public:
        virtual ~IDeltaSink() = default;
        virtual bool push(const InventoryDelta& delta) = 0;

        // false = pushing is switched off for good (e.g. no credentials);
        // deltas are then dropped instead of kept for a retry.
        virtual bool enabled() const { return true; }
    };

    // POSTs deltas to <url>/inventory/update with a bearer token. Retries
    // with 1s, 2s, 4s... backoff; stop() cuts a pending backoff short.
    class DeltaPusher final : public IDeltaSink {
    public:
        explicit DeltaPusher(ApiConfig cfg);
        ~DeltaPusher() override;

        bool push(const InventoryDelta& delta) override;
        bool enabled() const override { return !cfg_.api_key.empty(); }
        bool health_check();
        void stop();

    private:
        bool wait_backoff_(std::chrono::milliseconds d) const;

        struct Impl;
        std::unique_ptr<Impl> impl_;

        ApiConfig cfg_;
        std::atomic<bool> stopped_{false};
    };

    // Drains the batcher and hands the result to a sink. A delta the sink
    // refused is kept and the next drain is merged into it, so no event is
    // lost before a push succeeds. A disabled sink gets nothing and the
    // drained deltas are discarded.
    class DeltaForwarder {
    public:
        DeltaForwarder(DeltaBatcher& batcher, IDeltaSink& sink);

        // Returns true if something was delivered.
        bool forward_once();

        bool has_undelivered() const { return undelivered_.has_value(); }
        size_t undelivered_events() const { return undelivered_ ? undelivered_->events.size() : 0; }

    private:
        DeltaBatcher& batcher_;
        IDeltaSink& sink_;
        std::optional<InventoryDelta> undelivered_;
        std::optional<Counts> last_pushed_counts_;
        bool disabled_logged_ = false;
    };
}
