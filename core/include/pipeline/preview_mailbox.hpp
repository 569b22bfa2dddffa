#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>

namespace shelf {
    // Hand-off from the processing thread to the preview encoder. The
    // producer never blocks: once `depth` items are waiting, the stalest one
    // is evicted. After close() every post is ignored and takers return.
    template <class T>
    class PreviewMailbox {
    public:
        explicit PreviewMailbox(size_t depth) : depth_(depth) {}

        // Returns false if the item was not accepted (closed or zero depth).
        bool post(T item) {
            std::unique_lock lk(mtx_);
            if (closed_ || depth_ == 0) return false;
            while (slots_.size() >= depth_) {
                slots_.pop_front();
                ++evicted_;
            }
            slots_.push_back(std::move(item));
            lk.unlock();
            ready_.notify_one();
            return true;
        }

        bool take(T& out, std::chrono::milliseconds wait) {
            std::unique_lock lk(mtx_);
            ready_.wait_for(lk, wait, [this] { return closed_ || !slots_.empty(); });
            if (closed_ || slots_.empty()) return false;
            out = std::move(slots_.front());
            slots_.pop_front();
            return true;
        }

        void close() {
            std::unique_lock lk(mtx_);
            closed_ = true;
            slots_.clear();
            lk.unlock();
            ready_.notify_all();
        }

        uint64_t evicted() const {
            std::lock_guard lk(mtx_);
            return evicted_;
        }

        size_t waiting() const {
            std::lock_guard lk(mtx_);
            return slots_.size();
        }

    private:
        const size_t depth_;
        mutable std::mutex mtx_;
        std::condition_variable ready_;
        std::deque<T> slots_;
        uint64_t evicted_ = 0;
        bool closed_ = false;
    };
}
