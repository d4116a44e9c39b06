#include <gtest/gtest.h>

#include "config.h"
#include "tracker/track.h"
#include "tracker/track_validator.h"

namespace {

// Трек по прямой вдоль x с шагом step, кадры подряд начиная с 0.
Track straight_track(int id, int n, float step) {
    Track t;
    t.id = id;
    for (int i = 0; i < n; ++i) {
        const cv::Point2f c(20.f + step * i, 50.f);
        t.frames.push_back(i);
        t.bboxes.emplace_back((int)c.x - 5, (int)c.y - 5, 10, 10);
        t.centroids.push_back(c);
        t.areas.push_back(100.0);
        t.confidences.push_back(0.9f);
        t.position_history.push_back(c);
        t.total_detections++;
    }
    return t;
}

} // namespace

TEST(TrackValidatorTest, SingleDetectionIsNeverValid) {
    ValidationConfig cfg;
    cfg.min_track_length = 1;
    cfg.min_displacement = 0;
    cfg.min_speed = 0;
    TrackValidator v(cfg);

    Track t = straight_track(1, 1, 0.f);
    EXPECT_FALSE(v.length_ok(t));
    EXPECT_FALSE(v.is_valid(t));
}

TEST(TrackValidatorTest, AcceptsSteadyCrawler) {
    TrackValidator v{ValidationConfig()};
    Track t = straight_track(1, 8, 3.f);   // 21 px, 3 px/det
    EXPECT_TRUE(v.length_ok(t));
    EXPECT_TRUE(v.displacement_ok(t));
    EXPECT_TRUE(v.speed_ok(t));
    EXPECT_TRUE(v.is_valid(t));
}

TEST(TrackValidatorTest, RejectsShortTrack) {
    TrackValidator v{ValidationConfig()};
    Track t = straight_track(1, 4, 5.f);
    EXPECT_FALSE(v.length_ok(t));
    EXPECT_TRUE(v.displacement_ok(t));
    EXPECT_FALSE(v.is_valid(t));
}

TEST(TrackValidatorTest, RejectsStationaryNoise) {
    TrackValidator v{ValidationConfig()};
    Track t = straight_track(1, 10, 0.5f);   // 4.5 px total
    EXPECT_TRUE(v.length_ok(t));
    EXPECT_FALSE(v.displacement_ok(t));
    EXPECT_FALSE(v.is_valid(t));
}

TEST(TrackValidatorTest, RejectsTooFastForBenthos) {
    TrackValidator v{ValidationConfig()};
    Track t = straight_track(1, 6, 40.f);
    EXPECT_TRUE(v.displacement_ok(t));
    EXPECT_FALSE(v.speed_ok(t));
    EXPECT_FALSE(v.is_valid(t));
}

TEST(TrackValidatorTest, ValidateFlagsEachTrack) {
    TrackValidator v{ValidationConfig()};
    std::vector<Track> tracks{
            straight_track(1, 8, 3.f),
            straight_track(2, 2, 3.f),
            straight_track(3, 6, 40.f),
            straight_track(4, 12, 2.f)};

    EXPECT_EQ(v.validate(tracks), 2);
    EXPECT_TRUE(tracks[0].is_valid);
    EXPECT_FALSE(tracks[1].is_valid);
    EXPECT_FALSE(tracks[2].is_valid);
    EXPECT_TRUE(tracks[3].is_valid);
}

TEST(TrackMetricsTest, SummarizeCopiesDerivedNumbers) {
    Track t = straight_track(7, 5, 4.f);
    t.frames = {2, 3, 6, 7, 9};
    t.coupled_detections = 2;
    t.is_valid = true;

    TrackMetrics m = summarize(t);
    EXPECT_EQ(m.track_id, 7);
    EXPECT_EQ(m.length, 5);
    EXPECT_DOUBLE_EQ(m.displacement, 16.0);
    EXPECT_DOUBLE_EQ(m.avg_speed, 4.0);
    EXPECT_EQ(m.total_duration, 8);
    EXPECT_EQ(m.rest_periods, 2);
    EXPECT_DOUBLE_EQ(m.coupling_rate, 40.0);
    EXPECT_EQ(m.first_frame, 2);
    EXPECT_EQ(m.last_frame, 9);
    EXPECT_TRUE(m.is_valid);
}
