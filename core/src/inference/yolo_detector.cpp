#include <inference/yolo_detector.hpp>

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <ncnn/allocator.h>
#include <ncnn/net.h>

namespace shelf {
    namespace {
        std::string resolve_path_or_throw(const std::string& p) {
            namespace fs = std::filesystem;
            if (fs::exists(fs::path(p))) return p;
            const fs::path alt = fs::path("../../../") / p;
            if (fs::exists(alt)) return alt.string();
            throw std::runtime_error("Model path not found: " + p);
        }
    } // namespace

    const std::vector<std::string>& coco_class_names() {
        static const std::vector<std::string> kNames = {
            "person", "bicycle", "car", "motorcycle", "airplane", "bus", "train", "truck", "boat",
            "traffic light", "fire hydrant", "stop sign", "parking meter", "bench", "bird", "cat",
            "dog", "horse", "sheep", "cow", "elephant", "bear", "zebra", "giraffe", "backpack",
            "umbrella", "handbag", "tie", "suitcase", "frisbee", "skis", "snowboard", "sports ball",
            "kite", "baseball bat", "baseball glove", "skateboard", "surfboard", "tennis racket",
            "bottle", "wine glass", "cup", "fork", "knife", "spoon", "bowl", "banana", "apple",
            "sandwich", "orange", "broccoli", "carrot", "hot dog", "pizza", "donut", "cake", "chair",
            "couch", "potted plant", "bed", "dining table", "toilet", "tv", "laptop", "mouse",
            "remote", "keyboard", "cell phone", "microwave", "oven", "toaster", "sink",
            "refrigerator", "book", "clock", "vase", "scissors", "teddy bear", "hair drier",
            "toothbrush"
        };
        return kNames;
    }

    class YoloDetector::Impl {
    public:
        explicit Impl(const YoloDetectorConfig& cfg) {
            net_.opt.use_vulkan_compute = false;
            net_.opt.num_threads = std::max(1, cfg.ncnn_threads);
            workspace_pool_allocator_.set_size_compare_ratio(0.0f);

            const std::string param = resolve_path_or_throw(cfg.param_path);
            const std::string bin = resolve_path_or_throw(cfg.bin_path);

            if (net_.load_param(param.c_str()) != 0) {
                throw std::runtime_error("Failed to load YOLO param: " + param);
            }
            if (net_.load_model(bin.c_str()) != 0) {
                throw std::runtime_error("Failed to load YOLO weights: " + bin);
            }
        }

        std::vector<Detection> detect(const cv::Mat& bgr, const YoloDetectorConfig& cfg) const {
            if (bgr.empty() || bgr.type() != CV_8UC3) return {};

            const int size = cfg.input_size;
            ncnn::Mat in = ncnn::Mat::from_pixels_resize(
                bgr.data,
                ncnn::Mat::PIXEL_BGR2RGB,
                bgr.cols,
                bgr.rows,
                static_cast<int>(bgr.step[0]),
                size,
                size);
            static const float kNorm[3] = {1.0f / 255.0f, 1.0f / 255.0f, 1.0f / 255.0f};
            in.substract_mean_normalize(nullptr, kNorm);

            ncnn::Extractor ex = net_.create_extractor();
            ex.set_light_mode(true);
            thread_local ncnn::UnlockedPoolAllocator blob_pool_allocator;
            thread_local bool blob_pool_initialized = false;
            if (!blob_pool_initialized) {
                blob_pool_allocator.set_size_compare_ratio(0.0f);
                blob_pool_initialized = true;
            }
            ex.set_blob_allocator(&blob_pool_allocator);
            ex.set_workspace_allocator(&workspace_pool_allocator_);
            if (ex.input("in0", in) != 0) {
                throw std::runtime_error("YOLO input blob rejected");
            }

            ncnn::Mat out;
            if (ex.extract("out0", out) != 0) {
                throw std::runtime_error("YOLO output blob missing");
            }

            const int num_classes = static_cast<int>(cfg.class_names.size());
            const int features = 4 + num_classes;

            // Expected layout: h = 4 + classes rows, w = anchors. Some exports
            // come out transposed.
            const bool rows_are_features = out.h == features;
            if (!rows_are_features && out.w != features) {
                throw std::runtime_error("YOLO output shape " + std::to_string(out.w) + "x" +
                                         std::to_string(out.h) + " does not match " +
                                         std::to_string(num_classes) + " classes");
            }
            const int anchors = rows_are_features ? out.w : out.h;
            auto at = [&out, rows_are_features](int feature, int anchor) {
                return rows_are_features ? out.row(feature)[anchor] : out.row(anchor)[feature];
            };

            const float sx = static_cast<float>(bgr.cols) / static_cast<float>(size);
            const float sy = static_cast<float>(bgr.rows) / static_cast<float>(size);

            std::vector<Detection> candidates;
            candidates.reserve(256);

            for (int a = 0; a < anchors; ++a) {
                int best_class = -1;
                float best_score = 0.0f;
                for (int c = 0; c < num_classes; ++c) {
                    const float s = at(4 + c, a);
                    if (s > best_score) {
                        best_score = s;
                        best_class = c;
                    }
                }
                if (best_class < 0 || best_score < cfg.confidence) continue;

                const float cx = at(0, a);
                const float cy = at(1, a);
                const float w = at(2, a);
                const float h = at(3, a);

                const float x1 = std::max(0.0f, (cx - w * 0.5f) * sx);
                const float y1 = std::max(0.0f, (cy - h * 0.5f) * sy);
                const float x2 = std::min(static_cast<float>(bgr.cols), (cx + w * 0.5f) * sx);
                const float y2 = std::min(static_cast<float>(bgr.rows), (cy + h * 0.5f) * sy);
                if (x2 <= x1 || y2 <= y1) continue;

                Detection d;
                d.box = Box{x1, y1, x2 - x1, y2 - y1};
                d.class_id = best_class;
                d.class_name = cfg.class_names[static_cast<size_t>(best_class)];
                d.score = best_score;
                candidates.push_back(std::move(d));
            }

            std::vector<int> order(candidates.size());
            for (size_t i = 0; i < candidates.size(); ++i) order[i] = static_cast<int>(i);

            std::sort(order.begin(),
                      order.end(),
                      [&candidates](int a, int b) {
                          return candidates[static_cast<size_t>(a)].score >
                                 candidates[static_cast<size_t>(b)].score;
                      });

            if (cfg.top_k > 0 && static_cast<int>(order.size()) > cfg.top_k) {
                order.resize(static_cast<size_t>(cfg.top_k));
            }

            // Class-aware NMS.
            std::vector<int> keep_indices;
            keep_indices.reserve(order.size());
            for (int idx : order) {
                const Detection& cand = candidates[static_cast<size_t>(idx)];
                bool keep = true;
                for (int kept : keep_indices) {
                    const Detection& k = candidates[static_cast<size_t>(kept)];
                    if (k.class_id == cand.class_id && iou(cand.box, k.box) > cfg.nms_threshold) {
                        keep = false;
                        break;
                    }
                }
                if (keep) keep_indices.push_back(idx);
            }

            std::vector<Detection> out_dets;
            out_dets.reserve(keep_indices.size());
            for (int idx : keep_indices) {
                out_dets.push_back(candidates[static_cast<size_t>(idx)]);
            }
            return out_dets;
        }

    private:
        ncnn::Net net_;
        mutable ncnn::PoolAllocator workspace_pool_allocator_;
    };

    YoloDetector::YoloDetector(YoloDetectorConfig cfg)
        : cfg_(std::move(cfg)) {
        if (cfg_.class_names.empty()) cfg_.class_names = coco_class_names();
        cfg_.input_size = std::max(32, cfg_.input_size);
        impl_ = std::make_unique<Impl>(cfg_);
    }

    YoloDetector::~YoloDetector() = default;
    YoloDetector::YoloDetector(YoloDetector&&) noexcept = default;
    YoloDetector& YoloDetector::operator=(YoloDetector&&) noexcept = default;

    std::vector<Detection> YoloDetector::detect(const cv::Mat& bgr) const {
        return impl_->detect(bgr, cfg_);
    }
}
