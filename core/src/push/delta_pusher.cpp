#include <push/delta_pusher.hpp>

#include <algorithm>
#include <iostream>
#include <thread>
#include <utility>

#include <httplib.h>

#include <inventory/delta_json.hpp>

namespace shelf {
    struct DeltaPusher::Impl {
        explicit Impl(const std::string& url) : cli(url) {}
        httplib::Client cli;
    };

    DeltaPusher::DeltaPusher(ApiConfig cfg)
        : impl_(std::make_unique<Impl>(cfg.url)),
          cfg_(std::move(cfg)) {
        const auto timeout = std::chrono::milliseconds(std::max(1, cfg_.timeout_ms));
        impl_->cli.set_connection_timeout(timeout);
        impl_->cli.set_read_timeout(timeout);
        impl_->cli.set_keep_alive(true);
        if (!cfg_.api_key.empty()) impl_->cli.set_bearer_token_auth(cfg_.api_key);
    }

    DeltaPusher::~DeltaPusher() = default;

    void DeltaPusher::stop() {
        stopped_ = true;
        impl_->cli.stop();
    }

    bool DeltaPusher::wait_backoff_(std::chrono::milliseconds d) const {
        const auto until = std::chrono::steady_clock::now() + d;
        while (std::chrono::steady_clock::now() < until) {
            if (stopped_) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return !stopped_;
    }

    bool DeltaPusher::push(const InventoryDelta& delta) {
        if (cfg_.api_key.empty()) {
            thread_local bool warned = false;
            if (!warned) {
                std::cerr << "[Push](push) No API key configured, skipping delta push\n";
                warned = true;
            }
            return false;
        }

        const std::string body = to_json(delta);

        for (int attempt = 0; attempt < cfg_.max_retries && !stopped_; ++attempt) {
            auto res = impl_->cli.Post("/inventory/update", body, "application/json");
            if (res && res->status >= 200 && res->status < 300) {
                std::cout << "[Push] Delta pushed: " << delta.events.size() << " events, "
                          << delta.counts.size() << " items\n";
                return true;
            }

            if (res) {
                std::cerr << "[Push](push) HTTP error (attempt " << attempt + 1 << "): "
                          << res->status << " - " << res->body << "\n";
            } else {
                std::cerr << "[Push](push) Request error (attempt " << attempt + 1 << "): "
                          << httplib::to_string(res.error()) << "\n";
            }

            if (attempt + 1 < cfg_.max_retries) {
                if (!wait_backoff_(std::chrono::seconds(1LL << attempt))) break;
            }
        }

        std::cerr << "[Push](push) Failed to push delta after " << cfg_.max_retries << " attempts\n";
        return false;
    }

    bool DeltaPusher::health_check() {
        auto res = impl_->cli.Get("/health");
        if (!res || res->status != 200) {
            std::cerr << "[Push](health_check) backend not reachable at " << cfg_.url << "\n";
            return false;
        }
        return true;
    }

    DeltaForwarder::DeltaForwarder(DeltaBatcher& batcher, IDeltaSink& sink)
        : batcher_(batcher),
          sink_(sink) {}

    bool DeltaForwarder::forward_once() {
        InventoryDelta next = batcher_.drain();
        if (!sink_.enabled()) {
            if (!disabled_logged_) {
                std::cerr << "[Push](forward_once) delta sink disabled, discarding deltas\n";
                disabled_logged_ = true;
            }
            undelivered_.reset();
            return false;
        }

        if (undelivered_) {
            merge_delta(*undelivered_, std::move(next));
        } else {
            undelivered_ = std::move(next);
        }

        const bool counts_changed = !last_pushed_counts_ || *last_pushed_counts_ != undelivered_->counts;
        if (undelivered_->events.empty() && !counts_changed) {
            undelivered_.reset();
            return false;
        }

        if (!sink_.push(*undelivered_)) {
            return false;
        }

        last_pushed_counts_ = undelivered_->counts;
        undelivered_.reset();
        return true;
    }
}
