#pragma once
#include <opencv2/core.hpp>

namespace util {

// Euclidean distance between two points (pixels).
float distance(const cv::Point2f& a, const cv::Point2f& b);

// Square window of side 2*radius centered on p (not clamped to the frame).
cv::Rect squareAround(const cv::Point2f& p, float radius);

// 4*pi*area / perimeter^2 clamped to [0,1]. Zero perimeter -> 0.
float circularity(double area, double perimeter);

// max(w,h) / min(w,h). Zero side -> kAspectRatioCap.
float aspectRatio(int w, int h);

constexpr float kAspectRatioCap = 1.0e6f;

} // namespace util
