#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>

#include "config.h"
#include "overlay/trail_renderer.h"
#include "tracker/track.h"

namespace {

Track crawler(int id, int n, float step, float y = 30.f) {
    Track t;
    t.id = id;
    for (int i = 0; i < n; ++i) {
        const cv::Point2f c(20.f + step * i, y);
        t.frames.push_back(i);
        t.bboxes.emplace_back((int)c.x - 5, (int)c.y - 5, 10, 10);
        t.centroids.push_back(c);
        t.areas.push_back(80.0);
        t.confidences.push_back(0.8f);
        t.position_history.push_back(c);
        t.total_detections++;
    }
    return t;
}

OverlayConfig no_labels() {
    OverlayConfig cfg;
    cfg.show_labels = false;
    return cfg;
}

} // namespace

TEST(TrailRendererTest, LabelShowsCouplingShare) {
    Track t = crawler(3, 4, 2.f);
    t.coupled_detections = 1;
    EXPECT_EQ(TrailRenderer::label_for(t), "ID:3 (25% coupled)");

    Track empty;
    empty.id = 9;
    EXPECT_EQ(TrailRenderer::label_for(empty), "ID:9");
}

TEST(TrailRendererTest, ValidTrackIsGreen) {
    TrailRenderer r(no_labels(), ValidationConfig());
    Track t = crawler(1, 8, 3.f);   // последняя точка (41, 30)

    cv::Mat frame(60, 80, CV_8UC3, cv::Scalar(0, 0, 0));
    r.render(frame, {t}, -1);

    EXPECT_EQ(frame.at<cv::Vec3b>(30, 41), cv::Vec3b(0, 255, 0));
}

TEST(TrailRendererTest, ProvisionalTrackIsOrange) {
    TrailRenderer r(no_labels(), ValidationConfig());
    Track t = crawler(2, 2, 3.f);   // слишком короткий

    cv::Mat frame(60, 80, CV_8UC3, cv::Scalar(0, 0, 0));
    r.render(frame, {t}, -1);

    EXPECT_EQ(frame.at<cv::Vec3b>(30, 23), cv::Vec3b(0, 165, 255));
}

TEST(TrailRendererTest, CurrentDetectionGetsABox) {
    TrailRenderer r(no_labels(), ValidationConfig());
    Track t = crawler(1, 8, 3.f);
    const cv::Rect box = t.bboxes.back();

    cv::Mat frame(60, 80, CV_8UC3, cv::Scalar(0, 0, 0));
    r.render(frame, {t}, t.frames.back());
    EXPECT_EQ(frame.at<cv::Vec3b>(box.y + 8, box.x), cv::Vec3b(0, 255, 0));

    cv::Mat stale(60, 80, CV_8UC3, cv::Scalar(0, 0, 0));
    r.render(stale, {t}, t.frames.back() + 1);
    EXPECT_EQ(stale.at<cv::Vec3b>(box.y + 8, box.x), cv::Vec3b(0, 0, 0));
}

TEST(TrailRendererTest, GrayFrameBecomesColor) {
    TrailRenderer r(OverlayConfig(), ValidationConfig());
    Track t = crawler(1, 8, 3.f);

    cv::Mat frame(60, 80, CV_8UC1, cv::Scalar(128));
    r.render(frame, {t}, t.frames.back());
    EXPECT_EQ(frame.type(), CV_8UC3);
}

TEST(TrailRendererTest, EmptyFrameIsIgnored) {
    TrailRenderer r(OverlayConfig(), ValidationConfig());
    cv::Mat frame;
    r.render(frame, {crawler(1, 3, 1.f)}, 0);
    EXPECT_TRUE(frame.empty());
}
