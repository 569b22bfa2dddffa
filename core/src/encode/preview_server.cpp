#include <encode/preview_server.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include <httplib.h>
#include <opencv2/imgcodecs.hpp>

namespace shelf {
    namespace {
        using Jpeg = std::shared_ptr<const std::vector<uint8_t>>;

        constexpr const char* kBoundary = "shelfpreview";

        void no_cache(httplib::Response& res) {
            res.set_header("Cache-Control", "no-store, no-cache, must-revalidate, max-age=0");
            res.set_header("Pragma", "no-cache");
        }
    } // namespace

    struct PreviewServer::Impl {
        Impl(std::string h, int p) : host(std::move(h)), port(p) {}

        std::string host;
        int port;

        httplib::Server svr;
        std::thread thr;
        std::atomic<bool> running{false};

        // latest frame
        mutable std::mutex frame_mtx;
        std::condition_variable frame_cv;
        Jpeg jpeg;
        uint64_t seq = 0;
        std::string status = "{}";

        mutable std::mutex provider_mtx;
        JsonProvider inventory;

        void latest(Jpeg& out_jpeg, uint64_t& out_seq) const {
            std::lock_guard lk(frame_mtx);
            out_jpeg = jpeg;
            out_seq = seq;
        }

        // Blocks until a frame newer than `after` arrives or the server stops.
        bool wait_newer(uint64_t after, Jpeg& out_jpeg, uint64_t& out_seq) {
            std::unique_lock lk(frame_mtx);
            frame_cv.wait(lk, [&] { return seq != after || !running; });
            if (!running) return false;
            out_jpeg = jpeg;
            out_seq = seq;
            return true;
        }

        void routes() {
            svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
                res.set_content("ok", "text/plain");
            });

            svr.Get("/inventory", [this](const httplib::Request&, httplib::Response& res) {
                JsonProvider provider;
                {
                    std::lock_guard lk(provider_mtx);
                    provider = inventory;
                }
                no_cache(res);
                if (!provider) {
                    res.status = 503;
                    res.set_content("{}", "application/json");
                    return;
                }
                res.set_content(provider(), "application/json");
            });

            svr.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
                std::string body;
                {
                    std::lock_guard lk(frame_mtx);
                    body = status;
                }
                no_cache(res);
                res.set_content(body, "application/json");
            });

            svr.Get("/preview.jpg", [this](const httplib::Request&, httplib::Response& res) {
                Jpeg frame;
                uint64_t s = 0;
                latest(frame, s);
                no_cache(res);
                if (!frame || frame->empty()) {
                    res.status = 204;
                    return;
                }
                res.set_content(reinterpret_cast<const char*>(frame->data()), frame->size(), "image/jpeg");
            });

            svr.Get("/preview.mjpg", [this](const httplib::Request&, httplib::Response& res) {
                no_cache(res);
                res.set_header("Connection", "close");
                res.set_chunked_content_provider(
                    std::string("multipart/x-mixed-replace; boundary=") + kBoundary,
                    [this](size_t, httplib::DataSink& sink) {
                        uint64_t sent = 0;
                        Jpeg frame;
                        while (wait_newer(sent, frame, sent)) {
                            if (!frame || frame->empty()) continue;
                            const std::string part = std::string("--") + kBoundary + "\r\n"
                                                     "Content-Type: image/jpeg\r\n"
                                                     "Content-Length: " + std::to_string(frame->size()) + "\r\n\r\n";
                            if (!sink.write(part.data(), part.size())) return false;
                            if (!sink.write(reinterpret_cast<const char*>(frame->data()), frame->size())) return false;
                            if (!sink.write("\r\n", 2)) return false;
                        }
                        sink.done();
                        return true;
                    });
            });
        }
    };

    PreviewServer::PreviewServer(std::string host, int port)
        : impl_(std::make_unique<Impl>(std::move(host), port)) {}

    PreviewServer::~PreviewServer() {
        stop();
    }

    bool PreviewServer::start() {
        if (impl_->running) return true;

        impl_->routes();
        if (impl_->port == 0) {
            impl_->port = impl_->svr.bind_to_any_port(impl_->host);
            if (impl_->port <= 0) {
                std::cerr << "[Preview](start) cannot bind " << impl_->host << "\n";
                return false;
            }
        } else if (!impl_->svr.bind_to_port(impl_->host, impl_->port)) {
            std::cerr << "[Preview](start) cannot bind " << impl_->host << ":" << impl_->port << "\n";
            return false;
        }

        impl_->running = true;
        impl_->thr = std::thread([this] { impl_->svr.listen_after_bind(); });
        impl_->svr.wait_until_ready();

        const std::string base = "http://" + impl_->host + ":" + std::to_string(impl_->port);
        std::cout << "[Preview] Video: " << base << "/preview.mjpg\n";
        std::cout << "[Preview] Inventory: " << base << "/inventory\n";
        return true;
    }

    void PreviewServer::stop() {
        if (!impl_ || !impl_->running) return;
        {
            std::lock_guard lk(impl_->frame_mtx);
            impl_->running = false;
        }
        impl_->frame_cv.notify_all();

        impl_->svr.stop();
        if (impl_->thr.joinable()) impl_->thr.join();
    }

    bool PreviewServer::publish(const cv::Mat& frame, int quality, std::string status_json) {
        if (frame.empty() || frame.type() != CV_8UC3) return false;

        std::vector<uint8_t> buf;
        if (!cv::imencode(".jpg", frame, buf, {cv::IMWRITE_JPEG_QUALITY, quality})) {
            std::cerr << "[Preview](publish) imencode failed\n";
            return false;
        }

        {
            std::lock_guard lk(impl_->frame_mtx);
            impl_->jpeg = std::make_shared<const std::vector<uint8_t>>(std::move(buf));
            impl_->status = std::move(status_json);
            ++impl_->seq;
        }
        impl_->frame_cv.notify_all();
        return true;
    }

    void PreviewServer::set_inventory_provider(JsonProvider provider) {
        std::lock_guard lk(impl_->provider_mtx);
        impl_->inventory = std::move(provider);
    }

    int PreviewServer::port() const {
        return impl_->port;
    }

    uint64_t PreviewServer::frames_published() const {
        std::lock_guard lk(impl_->frame_mtx);
        return impl_->seq;
    }
}
