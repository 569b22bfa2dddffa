#include <tracking/tracker.hpp>

#include <algorithm>
#include <utility>
#include <vector>

namespace shelf {
    namespace {
        struct Track {
            int id = -1;
            int class_id = -1;
            std::string class_name;
            float score = 0.0f;
            Box box{};
            int hits = 0;
            int missed = 0;

            float vx = 0.0f;
            float vy = 0.0f;
        };

        // Two-stage greedy IoU association in the spirit of ByteTrack: confident
        // detections first, then low-score ones to rescue tracks that dimmed.
        // Tracks only match detections of their own class.
        class IouTracker final : public ITracker {
        public:
            explicit IouTracker(TrackerConfig cfg)
                : cfg_(std::move(cfg)) {}

            std::vector<TrackedDetection> update(const std::vector<Detection>& detections) override {
                for (auto& t : tracks_) {
                    t.missed += 1;
                    // Items on a shelf barely move; a damped velocity is enough.
                    t.box.x += t.vx;
                    t.box.y += t.vy;
                }

                std::vector<int> track_indices(tracks_.size());
                for (size_t i = 0; i < tracks_.size(); ++i) track_indices[i] = static_cast<int>(i);

                std::vector<int> high_det_indices;
                std::vector<int> low_det_indices;
                for (size_t i = 0; i < detections.size(); ++i) {
                    if (detections[i].score >= cfg_.high_thresh) {
                        high_det_indices.push_back(static_cast<int>(i));
                    } else if (detections[i].score >= cfg_.low_thresh) {
                        low_det_indices.push_back(static_cast<int>(i));
                    }
                }

                std::vector<int> unmatched_tracks;
                std::vector<int> unmatched_high_dets;
                match_greedy_(track_indices,
                              high_det_indices,
                              detections,
                              cfg_.match_iou_thresh,
                              unmatched_tracks,
                              unmatched_high_dets);

                std::vector<int> unmatched_tracks_after_low;
                std::vector<int> unused_low_dets;
                match_greedy_(unmatched_tracks,
                              low_det_indices,
                              detections,
                              cfg_.low_match_iou_thresh,
                              unmatched_tracks_after_low,
                              unused_low_dets);

                for (int di : unmatched_high_dets) {
                    const Detection& d = detections[static_cast<size_t>(di)];
                    if (d.score < cfg_.new_track_thresh) continue;

                    Track t;
                    t.id = next_track_id_++;
                    t.class_id = d.class_id;
                    t.class_name = d.class_name;
                    t.score = d.score;
                    t.box = d.box;
                    t.hits = 1;
                    t.missed = 0;
                    tracks_.push_back(std::move(t));
                }

                tracks_.erase(
                    std::remove_if(tracks_.begin(),
                                   tracks_.end(),
                                   [this](const Track& t) { return t.missed > cfg_.max_missed; }),
                    tracks_.end());

                // Only tracks seen in this frame are reported; lost ones keep
                // their id internally until max_missed.
                std::vector<TrackedDetection> out;
                out.reserve(tracks_.size());
                for (const auto& t : tracks_) {
                    if (t.missed > 0 || t.hits < cfg_.min_hits) continue;
                    TrackedDetection td;
                    td.track_id = t.id;
                    td.class_name = t.class_name;
                    td.confidence = t.score;
                    td.bbox = t.box;
                    out.push_back(std::move(td));
                }
                return out;
            }

        private:
            void apply_match_(Track& track, const Detection& det) {
                const float alpha = 0.5f;
                track.vx = alpha * (det.box.x - track.box.x) + (1.0f - alpha) * track.vx;
                track.vy = alpha * (det.box.y - track.box.y) + (1.0f - alpha) * track.vy;

                track.box = det.box;
                track.score = det.score;
                track.hits += 1;
                track.missed = 0;
            }

            void match_greedy_(const std::vector<int>& track_candidates,
                               const std::vector<int>& det_candidates,
                               const std::vector<Detection>& detections,
                               float iou_thresh,
                               std::vector<int>& unmatched_tracks,
                               std::vector<int>& unmatched_dets) {
                struct PairScore {
                    int ti = -1;
                    int di = -1;
                    float iou = 0.0f;
                };

                std::vector<PairScore> candidates;
                candidates.reserve(track_candidates.size() * det_candidates.size());
                for (int ti : track_candidates) {
                    const Track& t = tracks_[static_cast<size_t>(ti)];
                    for (int di : det_candidates) {
                        const Detection& d = detections[static_cast<size_t>(di)];
                        if (d.class_id != t.class_id) continue;
                        const float overlap = iou(t.box, d.box);
                        if (overlap >= iou_thresh) {
                            candidates.push_back(PairScore{ti, di, overlap});
                        }
                    }
                }

                std::sort(candidates.begin(),
                          candidates.end(),
                          [](const PairScore& a, const PairScore& b) { return a.iou > b.iou; });

                std::vector<char> track_taken(tracks_.size(), 0);
                std::vector<char> det_taken(detections.size(), 0);

                for (const auto& c : candidates) {
                    if (track_taken[static_cast<size_t>(c.ti)] ||
                        det_taken[static_cast<size_t>(c.di)]) {
                        continue;
                    }
                    track_taken[static_cast<size_t>(c.ti)] = 1;
                    det_taken[static_cast<size_t>(c.di)] = 1;
                    apply_match_(tracks_[static_cast<size_t>(c.ti)],
                                 detections[static_cast<size_t>(c.di)]);
                }

                unmatched_tracks.clear();
                unmatched_dets.clear();
                for (int ti : track_candidates) {
                    if (!track_taken[static_cast<size_t>(ti)]) unmatched_tracks.push_back(ti);
                }
                for (int di : det_candidates) {
                    if (!det_taken[static_cast<size_t>(di)]) unmatched_dets.push_back(di);
                }
            }

            TrackerConfig cfg_;
            int next_track_id_ = 1;
            std::vector<Track> tracks_;
        };
    } // namespace

    std::unique_ptr<ITracker> create_iou_tracker(const TrackerConfig& cfg) {
        return std::make_unique<IouTracker>(cfg);
    }
}
