#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>

#include "config.h"
#include "core/errors.h"
#include "core/frame_sink.h"
#include "core/frame_source.h"
#include "pipeline/benthic_pipeline.h"
#include "pipeline/frame_preprocessor.h"

namespace {

constexpr int kWidth = 160;
constexpr int kHeight = 120;
constexpr int kBackground = 100;

// Песок 100, тёмный "организм" 15x15 (60) ползёт вправо на step px за кадр.
std::vector<cv::Mat> crawling_clip(int n, int step = 4) {
    std::vector<cv::Mat> frames;
    for (int i = 0; i < n; ++i) {
        cv::Mat f(kHeight, kWidth, CV_8UC3, cv::Scalar::all(kBackground));
        const int cx = 40 + step * i;
        cv::rectangle(f, cv::Rect(cx - 7, 53, 15, 15), cv::Scalar::all(60), cv::FILLED);
        frames.push_back(f);
    }
    return frames;
}

cv::Mat flat_background(int w = kWidth, int h = kHeight) {
    return cv::Mat(h, w, CV_32FC3, cv::Scalar::all(kBackground));
}

AppConfig test_config() {
    AppConfig cfg;
    cfg.processing.frame_stride = 1;
    cfg.logging.background_logger = false;
    cfg.logging.detector_logger = false;
    cfg.logging.tracker_logger = false;
    cfg.logging.pipeline_logger = false;
    return cfg;
}

class CountingSink : public core::FrameSink {
public:
    void write(const cv::Mat& frame) override {
        count++;
        last = frame.clone();
    }
    int count = 0;
    cv::Mat last;
};

// Декодер "ломается" на кадре fail_at.
class FailingSource : public core::FrameSource {
public:
    FailingSource(std::vector<cv::Mat> frames, int fail_at)
        : inner_(std::move(frames)), fail_at_(fail_at) {}

    core::SourceInfo info() const override { return inner_.info(); }

    bool read(cv::Mat& out) override {
        if (pos_ == fail_at_) {
            throw core::SourceReadError("corrupt packet");
        }
        pos_++;
        return inner_.read(out);
    }

    void rewind() override {
        inner_.rewind();
        pos_ = 0;
    }

private:
    core::MatFrameSource inner_;
    int fail_at_;
    int pos_ = 0;
};

} // namespace

TEST(FramePreprocessorTest, ShiftsDifferenceAroundMidGray) {
    pipeline::FramePreprocessor pre(flat_background(), 4);
    cv::Mat frame(kHeight, kWidth, CV_8UC3, cv::Scalar::all(60));

    pipeline::FramePreprocessor::Output out = pre.process(frame);
    EXPECT_EQ(out.shifted.type(), CV_8UC3);
    EXPECT_EQ(out.shifted.at<cv::Vec3b>(10, 10), cv::Vec3b(88, 88, 88));
    EXPECT_EQ(out.deviation.type(), CV_32FC1);
    EXPECT_NEAR(out.deviation.at<float>(60, 80), -40.f, 1e-3);
}

TEST(FramePreprocessorTest, MismatchedFrameIsASourceError) {
    pipeline::FramePreprocessor pre(flat_background(), 5);
    cv::Mat small(10, 10, CV_8UC3, cv::Scalar::all(0));
    EXPECT_THROW(pre.process(small), core::SourceReadError);
}

TEST(BenthicPipelineTest, CrawlerBecomesOneValidTrack) {
    core::MatFrameSource src(crawling_clip(8));
    pipeline::BenthicPipeline pipe(test_config());

    CountingSink subtracted, annotated;
    pipeline::PipelineSinks sinks;
    sinks.background_subtracted = &subtracted;
    sinks.annotated = &annotated;

    pipeline::PipelineResult res = pipe.run(src, flat_background(), sinks);

    EXPECT_FALSE(res.source_failed);
    EXPECT_EQ(res.processed_frames, 8);
    ASSERT_EQ(res.timeline.size(), 8u);
    for (int i = 0; i < 8; ++i) {
        EXPECT_EQ(res.timeline[i].frame_idx, i);
        EXPECT_EQ(res.timeline[i].blobs, 1);
        EXPECT_EQ(res.timeline[i].active_tracks, 1);
        EXPECT_EQ(res.timeline[i].resting_tracks, 0);
    }
    EXPECT_EQ(res.total_blob_detections, 8);
    EXPECT_EQ(res.total_coupled_detections, 0);
    EXPECT_DOUBLE_EQ(res.overall_coupling_rate(), 0.0);

    ASSERT_EQ(res.tracks.size(), 1u);
    EXPECT_EQ(res.valid_tracks, 1);
    const Track& t = res.tracks.front();
    EXPECT_TRUE(t.is_valid);
    EXPECT_EQ(t.length(), 8);
    EXPECT_NEAR(t.avg_speed(), 4.0, 0.5);
    EXPECT_NEAR(t.centroids.front().x, 40.f, 1.f);
    EXPECT_NEAR(t.centroids.front().y, 60.f, 1.f);

    std::vector<TrackMetrics> m = res.metrics();
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(m[0].track_id, t.id);
    EXPECT_EQ(m[0].total_duration, 8);

    EXPECT_EQ(subtracted.count, 8);
    EXPECT_EQ(annotated.count, 8);
    EXPECT_EQ(annotated.last.size(), cv::Size(kWidth, kHeight));
}

TEST(BenthicPipelineTest, StrideSkipsRawFrames) {
    AppConfig cfg = test_config();
    cfg.processing.frame_stride = 2;
    core::MatFrameSource src(crawling_clip(8));

    pipeline::PipelineResult res = pipeline::BenthicPipeline(cfg).run(src, flat_background());
    EXPECT_EQ(res.processed_frames, 4);
    ASSERT_EQ(res.tracks.size(), 1u);
    EXPECT_EQ(res.tracks[0].length(), 4);
    EXPECT_NEAR(res.tracks[0].avg_speed(), 8.0, 0.5);
}

TEST(BenthicPipelineTest, MaxFramesCapsTheLoop) {
    AppConfig cfg = test_config();
    cfg.processing.max_frames = 4;
    core::MatFrameSource src(crawling_clip(8));

    pipeline::PipelineResult res = pipeline::BenthicPipeline(cfg).run(src, flat_background());
    EXPECT_EQ(res.processed_frames, 4);
    EXPECT_EQ(res.timeline.size(), 4u);
}

TEST(BenthicPipelineTest, ReadFailureKeepsPartialTracks) {
    FailingSource src(crawling_clip(8), 5);
    pipeline::BenthicPipeline pipe(test_config());

    pipeline::PipelineResult res = pipe.run(src, flat_background());

    EXPECT_TRUE(res.source_failed);
    EXPECT_FALSE(res.source_error.empty());
    EXPECT_EQ(res.processed_frames, 5);
    ASSERT_EQ(res.tracks.size(), 1u);
    EXPECT_EQ(res.tracks[0].length(), 5);
    EXPECT_TRUE(res.tracks[0].is_valid);
    EXPECT_EQ(res.valid_tracks, 1);
}

TEST(BenthicPipelineTest, MismatchedBackgroundStopsTheLoop) {
    core::MatFrameSource src(crawling_clip(3));
    pipeline::BenthicPipeline pipe(test_config());

    pipeline::PipelineResult res = pipe.run(src, flat_background(80, 60));
    EXPECT_TRUE(res.source_failed);
    EXPECT_EQ(res.processed_frames, 0);
    EXPECT_TRUE(res.tracks.empty());
}

TEST(BenthicPipelineTest, EmptyBackgroundIsAConfigurationError) {
    core::MatFrameSource src(crawling_clip(3));
    pipeline::BenthicPipeline pipe(test_config());
    EXPECT_THROW(pipe.run(src, cv::Mat()), core::ConfigurationError);
}

TEST(BenthicPipelineTest, AnalyzeEstimatesBackgroundThenTracks) {
    AppConfig cfg = test_config();
    cfg.background.method = "median";
    cfg.background.sample_every_nth_frame = 1;
    core::MatFrameSource src(crawling_clip(9));

    background::BackgroundResult bg;
    pipeline::PipelineResult res = pipeline::BenthicPipeline(cfg).analyze(src, bg);

    EXPECT_EQ(bg.meta.method, "median");
    EXPECT_EQ(bg.meta.frames_used, 9);
    EXPECT_FLOAT_EQ(bg.reference.at<cv::Vec3f>(60, 60)[0], (float)kBackground);

    EXPECT_EQ(res.processed_frames, 9);
    EXPECT_EQ(res.valid_tracks, 1);
}
