#pragma once

#include <opencv2/opencv.hpp>
#include <vector>
#include <string>

#include "config.h"
#include "tracker/track.h"
#include "tracker/track_validator.h"

//------------------------------------------------------------------------------
// TrailRenderer
//
// Draws per-track overlays for visual QA:
//  - full position history polyline + fading dots
//  - current-frame bbox, centroid and "ID:n (xx% coupled)" label
//
// Color: green for (provisionally) valid tracks, orange otherwise.
// Pure side effect on the frame, tracks are never modified.
//------------------------------------------------------------------------------
class TrailRenderer {
public:
    TrailRenderer(const OverlayConfig& cfg, const ValidationConfig& validation);

    // Grayscale frames are converted to BGR in place.
    void render(
            cv::Mat& frame,
            const std::vector<Track>& tracks,
            int frame_idx
    ) const;

    void draw_trail(cv::Mat& frame, const Track& t, const cv::Scalar& color) const;

    cv::Scalar color_for(const Track& t) const;

    static std::string label_for(const Track& t);

private:
    OverlayConfig cfg_;
    TrackValidator validator_;

    static cv::Rect clip_rect(const cv::Rect& r, int w, int h);

    static void draw_label(
            cv::Mat& frame,
            const cv::Point& org,
            const std::string& text,
            const cv::Scalar& color
    );
};
