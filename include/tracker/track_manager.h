#pragma once

#include <opencv2/opencv.hpp>

#include <vector>

#include "config.h"
#include "detect/blob.h"
#include "tracker/track.h"

// Менеджер треков: жадная ассоциация по расстоянию центроидов, состояние
// "отдыха" (resting) и завершение треков по бюджету пропущенных кадров.
//
// Состояния трека:
//  Active     - сопоставлен в текущем кадре;
//  Resting    - не сопоставлен, но frames_since_detection <= max_skip_frames;
//  Terminated - бюджет превышен, трек уходит в completed().
class TrackManager {
public:
    TrackManager(const TrackingConfig& cfg, const LoggingConfig& log);

    // Сбрасывает все треки и счётчик id.
    void reset();

    // Один кадр. frame_idx строго возрастает между вызовами,
    // иначе std::invalid_argument.
    void update(const std::vector<detect::Blob>& blobs, int frame_idx);

    // Переносит все активные треки в completed() и возвращает полный пул (по id).
    std::vector<Track> finish();

    const std::vector<Track>& active() const { return active_; }
    const std::vector<Track>& completed() const { return completed_; }

    int resting_count() const;

    // Расстояние blob-трек с учётом зоны покоя (половина, если blob в зоне).
    float match_distance(const detect::Blob& blob, const Track& track) const;

private:
    struct Candidate {
        int blob;
        int track;
        float dist;
    };

    void apply_match(Track& t, const detect::Blob& b, int frame_idx);
    void mark_unmatched(Track& t);
    Track spawn(const detect::Blob& b, int frame_idx);

    TrackingConfig cfg_; // - конфигурация трекера.
    LoggingConfig log_;  // - флаги логирования.
    int next_id_ = 1;    // - счётчик id для новых треков.
    int last_frame_ = -1; // - последний обработанный кадр.
    bool has_frame_ = false;

    std::vector<Track> active_;    // - активные и отдыхающие треки.
    std::vector<Track> completed_; // - завершённые треки, ждут валидации.
};
