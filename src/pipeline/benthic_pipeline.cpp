#include "pipeline/benthic_pipeline.h"
#include "pipeline/frame_preprocessor.h"
#include "core/errors.h"
#include "detect/blob_detector.h"
#include "overlay/trail_renderer.h"
#include "tracker/track_manager.h"
#include "tracker/track_validator.h"

#include <algorithm>
#include <iomanip>
#include <iostream>

namespace pipeline {

double PipelineResult::overall_coupling_rate() const {
    if (total_blob_detections == 0) return 0.0;
    return 100.0 * (double)total_coupled_detections / (double)total_blob_detections;
}

std::vector<TrackMetrics> PipelineResult::metrics() const {
    std::vector<TrackMetrics> out;
    out.reserve(tracks.size());
    for (const auto& t : tracks) {
        out.push_back(summarize(t));
    }
    return out;
}

BenthicPipeline::BenthicPipeline(const AppConfig& cfg) : cfg_(cfg) {}

int BenthicPipeline::frame_cap(const core::SourceInfo& info) const {
    return background::BackgroundEstimator::frame_cap_for(
            info.fps, cfg_.processing.duration_seconds, cfg_.processing.max_frames);
}

PipelineResult BenthicPipeline::run(core::FrameSource& source,
                                    const cv::Mat& background,
                                    const PipelineSinks& sinks) const {
    if (background.empty()) {
        throw core::ConfigurationError("empty background reference");
    }

    const LoggingConfig& log = cfg_.logging;
    const int stride = std::max(1, cfg_.processing.frame_stride);
    const int cap = frame_cap(source.info());

    FramePreprocessor pre(background, cfg_.processing.blur_kernel_size);
    detect::BlobDetector detector(cfg_.detection, log);
    TrackManager tracker(cfg_.tracking, log);
    TrackValidator validator(cfg_.validation);
    TrailRenderer renderer(cfg_.overlay, cfg_.validation);

    if (log.pipeline_logger) {
        std::cout << "[PIPE] processing every " << stride << " frames"
                  << (cap > 0 ? ", cap " + std::to_string(cap) + " raw frames" : std::string())
                  << std::endl;
    }

    PipelineResult res;
    cv::Mat frame;
    int raw_index = 0;
    int processed = 0;

    try {
        while (cap <= 0 || raw_index < cap) {
            if (!source.read(frame)) {
                break;
            }
            if (raw_index++ % stride != 0) {
                continue;
            }

            FramePreprocessor::Output p = pre.process(frame);
            detect::BlobDetector::FrameDetections det = detector.detect(p.deviation, processed);

            res.total_blob_detections += (int)det.blobs.size();
            res.total_coupled_detections += det.coupled;

            tracker.update(det.blobs, processed);

            FrameSummary fs;
            fs.frame_idx = processed;
            fs.active_tracks = (int)tracker.active().size();
            fs.resting_tracks = tracker.resting_count();
            fs.blobs = (int)det.blobs.size();
            fs.coupled_blobs = det.coupled;
            res.timeline.push_back(fs);

            if (sinks.background_subtracted) {
                sinks.background_subtracted->write(p.shifted);
            }
            if (sinks.annotated) {
                cv::Mat annotated = frame.clone();
                renderer.render(annotated, tracker.active(), processed);
                sinks.annotated->write(annotated);
            }

            processed++;

            if (log.pipeline_logger && cfg_.processing.progress_every_n_frames > 0 &&
                processed % cfg_.processing.progress_every_n_frames == 0) {
                std::cout << "[PIPE] frame " << processed
                          << " - " << fs.active_tracks << " tracks ("
                          << fs.resting_tracks << " resting, "
                          << std::fixed << std::setprecision(1)
                          << res.overall_coupling_rate() << "% coupled)"
                          << std::defaultfloat << std::endl;
            }
        }
    } catch (const core::SourceReadError& e) {
        // Частичный результат полезен: длинный клип может сломаться у самого конца.
        std::cerr << "[PIPE] frame loop stopped after " << processed
                  << " frames: " << e.what() << std::endl;
        res.source_failed = true;
        res.source_error = e.what();
    }

    res.processed_frames = processed;
    res.tracks = tracker.finish();
    res.valid_tracks = validator.validate(res.tracks);

    if (log.pipeline_logger) {
        std::cout << "[PIPE] valid tracks: " << res.valid_tracks
                  << "/" << res.tracks.size() << std::endl;
    }
    return res;
}

PipelineResult BenthicPipeline::analyze(core::FrameSource& source,
                                        background::BackgroundResult& bg_out,
                                        const PipelineSinks& sinks) const {
    background::BackgroundEstimator estimator(cfg_.background, cfg_.logging);
    bg_out = estimator.estimate(source, frame_cap(source.info()));
    source.rewind();
    return run(source, bg_out.reference, sinks);
}

} // namespace pipeline
