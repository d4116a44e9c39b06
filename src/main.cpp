#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

#include "app/guarded_run.h"
#include "config.h"
#include "core/frame_sink.h"
#include "core/frame_source.h"
#include "pipeline/benthic_pipeline.h"

namespace fs = std::filesystem;

// benthic_tracker <video> [config.toml] [output_dir]
int main(int argc, char *argv[]) {

    setvbuf(stdout, nullptr, _IONBF, 0);
    setvbuf(stderr, nullptr, _IONBF, 0);

    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <video> [config.toml] [output_dir]" << std::endl;
        return app::kExitUsage;
    }

    const std::string video_path = argv[1];
    const std::string config_path = argc > 2 ? argv[2] : "config.toml";
    const fs::path out_dir = argc > 3 ? argv[3] : "results";

    return app::guarded_run([&]() {
        // получаем конфигурацию из config.toml
        AppConfig cfg;
        if (fs::exists(config_path)) {
            cfg = load_app_config_file(config_path);
        } else {
            std::cerr << "config " << config_path << " not found, using defaults" << std::endl;
        }

        fs::create_directories(out_dir);
        const std::string stem = fs::path(video_path).stem().string();

        core::VideoFrameSource source(video_path);
        const core::SourceInfo si = source.info();
        std::cout << "[MAIN] " << video_path << " " << si.width << "x" << si.height
                  << " @ " << si.fps << " fps, " << si.frame_count << " frames" << std::endl;

        const double out_fps = si.fps > 0.0
                ? si.fps / std::max(1, cfg.processing.frame_stride)
                : 10.0;
        const cv::Size size(si.width, si.height);

        core::VideoFrameSink bg_sink((out_dir / (stem + "_background_subtracted.mp4")).string(),
                                     out_fps, size);
        core::VideoFrameSink annotated_sink((out_dir / (stem + "_benthic_activity.mp4")).string(),
                                            out_fps, size);

        pipeline::PipelineSinks sinks;
        sinks.background_subtracted = &bg_sink;
        sinks.annotated = &annotated_sink;

        pipeline::BenthicPipeline pipe(cfg);
        background::BackgroundResult bg;
        pipeline::PipelineResult res = pipe.analyze(source, bg, sinks);

        cv::Mat bg8;
        bg.reference.convertTo(bg8, CV_8U);
        const std::string bg_path = (out_dir / (stem + "_background.jpg")).string();
        if (!cv::imwrite(bg_path, bg8)) {
            std::cerr << "[MAIN] could not write " << bg_path << std::endl;
        }

        std::cout << "[MAIN] background: " << bg.meta.frames_used << " frames ("
                  << bg.meta.method << ", stride " << bg.meta.stride << ")" << std::endl;
        std::cout << "[MAIN] processed frames: " << res.processed_frames << std::endl;
        if (res.source_failed) {
            std::cout << "[MAIN] partial result, source error: " << res.source_error << std::endl;
        }

        std::cout << std::fixed << std::setprecision(1);
        for (const auto& m : res.metrics()) {
            if (!m.is_valid) continue;
            std::cout << "  Track " << m.track_id << ": " << m.length << " detections, "
                      << m.total_duration << " frame span, "
                      << m.rest_periods << " rest periods, "
                      << m.displacement << " px, "
                      << m.avg_speed << " px/det, "
                      << m.coupling_rate << "% coupled" << std::endl;
        }
        std::cout << "[MAIN] valid tracks: " << res.valid_tracks << "/" << res.tracks.size()
                  << ", coupling rate " << res.overall_coupling_rate() << "%" << std::endl;

        return res.source_failed ? app::kExitPartial : app::kExitOk;
    });
}
