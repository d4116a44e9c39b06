#include "overlay/trail_renderer.h"

#include <algorithm>
#include <cstdio>

static const cv::Scalar kValidColor(0, 255, 0);      // green
static const cv::Scalar kProvisionalColor(0, 165, 255); // orange

//------------------------------------------------------------------------------
// ctor
//------------------------------------------------------------------------------
TrailRenderer::TrailRenderer(const OverlayConfig& cfg, const ValidationConfig& validation)
        : cfg_(cfg), validator_(validation) {}

//------------------------------------------------------------------------------
// Utility helpers
//------------------------------------------------------------------------------
cv::Rect TrailRenderer::clip_rect(const cv::Rect& r, int w, int h) {
    int x1 = std::max(0, r.x);
    int y1 = std::max(0, r.y);
    int x2 = std::min(w, r.x + r.width);
    int y2 = std::min(h, r.y + r.height);

    if (x2 <= x1 || y2 <= y1)
        return cv::Rect(0, 0, 0, 0);

    return cv::Rect(x1, y1, x2 - x1, y2 - y1);
}

void TrailRenderer::draw_label(
        cv::Mat& frame,
        const cv::Point& org,
        const std::string& text,
        const cv::Scalar& color
) {
    int baseline = 0;
    cv::Size ts = cv::getTextSize(
            text, cv::FONT_HERSHEY_SIMPLEX, 0.4, 1, &baseline);

    cv::Rect bg(
            org.x,
            org.y - ts.height - baseline,
            ts.width + 4,
            ts.height + baseline + 4
    );

    bg = clip_rect(bg, frame.cols, frame.rows);
    if (bg.width > 0 && bg.height > 0) {
        cv::Mat roi = frame(bg);
        cv::Mat shade(roi.size(), roi.type(), cv::Scalar(0, 0, 0));
        cv::addWeighted(shade, 0.35, roi, 0.65, 0.0, roi);
    }

    cv::putText(
            frame, text, org,
            cv::FONT_HERSHEY_SIMPLEX, 0.4,
            color, 1, cv::LINE_AA
    );
}

cv::Scalar TrailRenderer::color_for(const Track& t) const {
    return validator_.is_valid(t) ? kValidColor : kProvisionalColor;
}

std::string TrailRenderer::label_for(const Track& t) {
    char buf[64];
    if (t.total_detections > 0)
        std::snprintf(buf, sizeof(buf), "ID:%d (%.0f%% coupled)", t.id, t.coupling_rate());
    else
        std::snprintf(buf, sizeof(buf), "ID:%d", t.id);
    return buf;
}

//------------------------------------------------------------------------------
// Trail: polyline over the whole history, dots grow towards the newest point
//------------------------------------------------------------------------------
void TrailRenderer::draw_trail(cv::Mat& frame, const Track& t, const cv::Scalar& color) const {
    const auto& hist = t.position_history;
    if (hist.size() < 2)
        return;

    std::vector<cv::Point> pts;
    pts.reserve(hist.size());
    for (const auto& p : hist)
        pts.emplace_back((int)p.x, (int)p.y);

    const std::vector<std::vector<cv::Point>> polys{pts};
    cv::polylines(frame, polys, false, color, std::max(1, cfg_.trail_thickness), cv::LINE_AA);

    const float n = (float)hist.size();
    for (size_t i = 0; i < pts.size(); ++i) {
        float alpha = (float)(i + 1) / n;
        int radius = std::max(1, (int)(cfg_.max_dot_radius * alpha));
        cv::circle(frame, pts[i], radius, color, -1);
    }
}

//------------------------------------------------------------------------------
// Render all tracks
//------------------------------------------------------------------------------
void TrailRenderer::render(
        cv::Mat& frame,
        const std::vector<Track>& tracks,
        int frame_idx
) const {
    if (frame.empty())
        return;

    if (frame.channels() == 1)
        cv::cvtColor(frame, frame, cv::COLOR_GRAY2BGR);

    // trails first, boxes on top
    for (const auto& t : tracks)
        draw_trail(frame, t, color_for(t));

    for (const auto& t : tracks) {
        if (t.frames.empty() || t.frames.back() != frame_idx)
            continue;

        const cv::Scalar color = color_for(t);
        const cv::Rect& r = t.bboxes.back();
        const cv::Point2f& c = t.centroids.back();

        cv::rectangle(frame, r, color, 2);
        cv::circle(frame, cv::Point((int)c.x, (int)c.y), 3, color, -1);

        if (cfg_.show_labels) {
            draw_label(frame, cv::Point(r.x, std::max(10, r.y - 5)),
                       label_for(t), color);
        }
    }
}
