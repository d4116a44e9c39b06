#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "config.h"
#include "background/background_estimator.h"
#include "core/frame_sink.h"
#include "core/frame_source.h"
#include "tracker/track.h"

namespace pipeline {

// Счётчики одного обработанного кадра (для таймлайна).
struct FrameSummary {
    int frame_idx = 0;       // - индекс обработанного кадра.
    int active_tracks = 0;   // - треки в активном наборе (включая отдыхающие).
    int resting_tracks = 0;  // - из них отдыхающие.
    int blobs = 0;           // - пятна, переданные трекеру.
    int coupled_blobs = 0;   // - из них coupled.
};

// Необязательные приёмники кадров. nullptr = не писать.
struct PipelineSinks {
    core::FrameSink* background_subtracted = nullptr;
    core::FrameSink* annotated = nullptr;
};

struct PipelineResult {
    std::vector<Track> tracks;             // - все треки (валидные и нет), по id.
    std::vector<FrameSummary> timeline;    // - по одному на обработанный кадр.
    int processed_frames = 0;
    int total_blob_detections = 0;
    int total_coupled_detections = 0;
    int valid_tracks = 0;
    bool source_failed = false;            // - цикл прерван ошибкой чтения.
    std::string source_error;

    double overall_coupling_rate() const;
    std::vector<TrackMetrics> metrics() const;
};

// Однопоточный покадровый цикл:
// preprocess -> detect (+coupling) -> track, в конце validate.
class BenthicPipeline {
public:
    explicit BenthicPipeline(const AppConfig& cfg);

    // Ошибка чтения посреди клипа не теряет накопленные треки:
    // они валидируются и возвращаются, source_failed = true.
    PipelineResult run(core::FrameSource& source,
                       const cv::Mat& background,
                       const PipelineSinks& sinks = PipelineSinks()) const;

    // Оценка фона + rewind + run.
    PipelineResult analyze(core::FrameSource& source,
                           background::BackgroundResult& bg_out,
                           const PipelineSinks& sinks = PipelineSinks()) const;

    int frame_cap(const core::SourceInfo& info) const;

private:
    AppConfig cfg_;
};

} // namespace pipeline
