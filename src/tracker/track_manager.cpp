#include "tracker/track_manager.h"
#include "util/geometry.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

/*
  Менеджер треков для медленных донных организмов.

  Порядок update():
  1) расстояние от каждого blob до последнего центроида каждого трека;
  2) для отдыхающих треков расстояние делится пополам, если blob в зоне покоя
     (мягкое смещение, не жёсткий гейт);
  3) пары с dist <= max_distance, по возрастанию, жадно один-к-одному;
  4) сопоставленные треки получают детекцию, отдых сбрасывается;
  5) несопоставленные: frames_since_detection++, либо отдых, либо завершение;
  6) оставшиеся blob-ы -> новые треки.
 */

TrackManager::TrackManager(const TrackingConfig& cfg, const LoggingConfig& log)
    : cfg_(cfg), log_(log) {}

void TrackManager::reset() {
    active_.clear();
    completed_.clear();
    next_id_ = 1;
    last_frame_ = -1;
    has_frame_ = false;
}

int TrackManager::resting_count() const {
    int n = 0;
    for (const auto& t : active_) {
        if (t.is_resting) n++;
    }
    return n;
}

float TrackManager::match_distance(const detect::Blob& blob, const Track& track) const {
    float d = util::distance(blob.centroid, track.centroids.back());
    if (track.is_resting && track.last_known_position &&
        util::distance(blob.centroid, *track.last_known_position) <= cfg_.rest_zone_radius) {
        d *= 0.5f;
    }
    return d;
}

void TrackManager::apply_match(Track& t, const detect::Blob& b, int frame_idx) {
    t.frames.push_back(frame_idx);
    t.bboxes.push_back(b.bbox);
    t.centroids.push_back(b.centroid);
    t.areas.push_back(b.area);
    t.confidences.push_back(b.confidence);

    t.last_seen_frame = frame_idx;
    t.last_known_position = b.centroid;
    t.frames_since_detection = 0;
    t.is_resting = false;
    t.rest_roi.reset();
    t.position_history.push_back(b.centroid);

    t.total_detections++;
    if (b.kind == detect::BlobKind::Coupled) t.coupled_detections++;
}

void TrackManager::mark_unmatched(Track& t) {
    t.frames_since_detection++;
    if (!t.is_resting && t.last_known_position) {
        t.is_resting = true;
        t.rest_roi = util::squareAround(*t.last_known_position, cfg_.rest_zone_radius);
    }
}

Track TrackManager::spawn(const detect::Blob& b, int frame_idx) {
    Track t;
    t.id = next_id_++;
    apply_match(t, b, frame_idx);
    return t;
}

void TrackManager::update(const std::vector<detect::Blob>& blobs, int frame_idx) {
    if (has_frame_ && frame_idx <= last_frame_) {
        throw std::invalid_argument("frame index " + std::to_string(frame_idx) +
                                    " is not after " + std::to_string(last_frame_));
    }
    has_frame_ = true;
    last_frame_ = frame_idx;

    const int nb = (int)blobs.size();
    const int nt = (int)active_.size();

    std::vector<Candidate> candidates;
    candidates.reserve((size_t)nb * (size_t)nt);
    for (int bi = 0; bi < nb; ++bi) {
        for (int ti = 0; ti < nt; ++ti) {
            const float d = match_distance(blobs[bi], active_[ti]);
            if (d <= cfg_.max_distance) candidates.push_back({bi, ti, d});
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b){ return a.dist < b.dist; });

    std::vector<char> blob_used(nb, 0);
    std::vector<char> track_used(nt, 0);
    int matched = 0;

    for (const auto& c : candidates) {
        if (blob_used[c.blob] || track_used[c.track]) continue;
        blob_used[c.blob] = 1;
        track_used[c.track] = 1;
        apply_match(active_[c.track], blobs[c.blob], frame_idx);
        matched++;
    }

    std::vector<Track> still_active;
    still_active.reserve(active_.size() + (size_t)nb);
    int terminated = 0;

    for (int ti = 0; ti < nt; ++ti) {
        Track& t = active_[ti];
        if (!track_used[ti]) {
            mark_unmatched(t);
            if (t.frames_since_detection > cfg_.max_skip_frames) {
                if (log_.tracker_logger) {
                    std::cout << "[TRK] terminate id=" << t.id
                              << " len=" << t.length()
                              << " last_seen=" << t.last_seen_frame << std::endl;
                }
                completed_.push_back(std::move(t));
                terminated++;
                continue;
            }
        }
        still_active.push_back(std::move(t));
    }

    int spawned = 0;
    for (int bi = 0; bi < nb; ++bi) {
        if (blob_used[bi]) continue;
        still_active.push_back(spawn(blobs[bi], frame_idx));
        spawned++;
    }
    active_ = std::move(still_active);

    if (log_.tracker_logger) {
        std::cout << "[TRK] frame=" << frame_idx
                  << " blobs=" << nb
                  << " matched=" << matched
                  << " spawned=" << spawned
                  << " terminated=" << terminated
                  << " active=" << active_.size()
                  << " resting=" << resting_count()
                  << std::endl;
    }
}

std::vector<Track> TrackManager::finish() {
    std::vector<Track> all = std::move(completed_);
    for (auto& t : active_) {
        all.push_back(std::move(t));
    }
    active_.clear();
    completed_.clear();

    std::sort(all.begin(), all.end(),
              [](const Track& a, const Track& b){ return a.id < b.id; });
    return all;
}
