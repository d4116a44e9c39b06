#include "util/geometry.h"
#include <algorithm>
#include <cmath>

namespace util {

float distance(const cv::Point2f& a, const cv::Point2f& b) {
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    return std::sqrt(dx*dx + dy*dy);
}

cv::Rect squareAround(const cv::Point2f& p, float radius) {
    return cv::Rect((int)(p.x - radius), (int)(p.y - radius),
                    (int)(2.0f * radius), (int)(2.0f * radius));
}

float circularity(double area, double perimeter) {
    if (perimeter <= 0.0 || area <= 0.0) return 0.0f;
    double c = (4.0 * CV_PI * area) / (perimeter * perimeter);
    return (float)std::min(1.0, c);
}

float aspectRatio(int w, int h) {
    int lo = std::min(w, h);
    int hi = std::max(w, h);
    if (lo <= 0) return kAspectRatioCap;
    return (float)hi / (float)lo;
}

} // namespace util
