#include "detect/blob_detector.h"
#include "blob/blob_coupler.h"
#include "util/geometry.h"

#include <algorithm>
#include <iostream>

namespace detect {

    BlobDetector::BlobDetector(const DetectionConfig& cfg, const LoggingConfig& log)
        : cfg_(cfg), log_(log) {
        const int k = std::max(1, cfg_.morph_kernel_size);
        kernel_ = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(k, k));
    }

    bool BlobDetector::area_ok(double area) const {
        return area >= cfg_.min_area && area <= cfg_.max_area;
    }

    bool BlobDetector::aspect_ratio_ok(float aspect_ratio) const {
        return aspect_ratio <= cfg_.max_aspect_ratio;
    }

    bool BlobDetector::circularity_ok(float circularity) const {
        return circularity >= cfg_.min_circularity;
    }

    cv::Mat BlobDetector::to_deviation(const cv::Mat& frame) {
        cv::Mat gray = frame;
        if (frame.channels() == 3) {
            cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
        }
        cv::Mat dev;
        if (gray.depth() == CV_8U) {
            gray.convertTo(dev, CV_32F, 1.0, -128.0);
        } else {
            gray.convertTo(dev, CV_32F);
        }
        return dev;
    }

    cv::Mat BlobDetector::clean_mask(const cv::Mat& mask) const {
        cv::Mat out;
        cv::morphologyEx(mask, out, cv::MORPH_CLOSE, kernel_);
        cv::morphologyEx(out, out, cv::MORPH_OPEN, kernel_);
        return out;
    }

    double BlobDetector::component_perimeter(const cv::Mat& component_mask) {
        // рамка в 1 пиксель: контур не должен упираться в край ROI
        cv::Mat padded;
        cv::copyMakeBorder(component_mask, padded, 1, 1, 1, 1, cv::BORDER_CONSTANT, cv::Scalar(0));

        std::vector<std::vector<cv::Point>> contours;
        cv::findContours(padded, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

        double perimeter = 0.0;
        for (const auto& c : contours) {
            perimeter = std::max(perimeter, cv::arcLength(c, true));
        }
        return perimeter;
    }

    std::vector<Blob> BlobDetector::extract_blobs(const cv::Mat& binary, int frame_idx, BlobKind kind) const {
        std::vector<Blob> blobs;

        cv::Mat labels, stats, centroids;
        const int n = cv::connectedComponentsWithStats(binary, labels, stats, centroids, 8, CV_32S);

        for (int l = 1; l < n; ++l) {
            const int area = stats.at<int>(l, cv::CC_STAT_AREA);
            const int x = stats.at<int>(l, cv::CC_STAT_LEFT);
            const int y = stats.at<int>(l, cv::CC_STAT_TOP);
            const int w = stats.at<int>(l, cv::CC_STAT_WIDTH);
            const int h = stats.at<int>(l, cv::CC_STAT_HEIGHT);

            if (!area_ok(area)) continue;

            const float ar = util::aspectRatio(w, h);
            if (!aspect_ratio_ok(ar)) continue;

            const cv::Rect roi(x, y, w, h);
            cv::Mat comp = (labels(roi) == l);
            const float circ = util::circularity(area, component_perimeter(comp));
            if (!circularity_ok(circ)) continue;

            Blob b;
            b.frame_idx = frame_idx;
            b.bbox = roi;
            b.centroid = cv::Point2f((float)centroids.at<double>(l, 0),
                                     (float)centroids.at<double>(l, 1));
            b.area = area;
            b.circularity = circ;
            b.aspect_ratio = ar;
            b.confidence = circ;
            b.kind = kind;
            blobs.push_back(b);
        }
        return blobs;
    }

    std::vector<Blob> BlobDetector::detect_dark(const cv::Mat& deviation, int frame_idx) const {
        cv::Mat mask;
        cv::compare(to_deviation(deviation), cv::Scalar(-cfg_.dark_threshold), mask, cv::CMP_LT);
        return extract_blobs(clean_mask(mask), frame_idx, BlobKind::Dark);
    }

    std::vector<Blob> BlobDetector::detect_bright(const cv::Mat& deviation, int frame_idx) const {
        cv::Mat mask;
        cv::compare(to_deviation(deviation), cv::Scalar(cfg_.bright_threshold), mask, cv::CMP_GT);
        return extract_blobs(clean_mask(mask), frame_idx, BlobKind::Bright);
    }

    std::vector<Blob> BlobDetector::detect_standard(const cv::Mat& deviation, int frame_idx) const {
        cv::Mat absdev = cv::abs(to_deviation(deviation));
        cv::Mat mask;
        cv::compare(absdev, cv::Scalar(cfg_.threshold), mask, cv::CMP_GT);
        return extract_blobs(clean_mask(mask), frame_idx, BlobKind::Standard);
    }

    BlobDetector::FrameDetections BlobDetector::detect(const cv::Mat& deviation, int frame_idx) const {
        FrameDetections out;
        const cv::Mat dev = to_deviation(deviation);

        std::vector<Blob> dark = detect_dark(dev, frame_idx);
        std::vector<Blob> bright = detect_bright(dev, frame_idx);
        out.dark = (int)dark.size();
        out.bright = (int)bright.size();

        blob::CouplingParams cp;
        cp.max_distance = cfg_.coupling_distance;
        cp.boost = cfg_.coupling_boost;
        blob::CouplingResult cr = blob::couple_blobs(dark, bright, cp);
        out.coupled = (int)cr.coupled.size();

        out.blobs = std::move(cr.coupled);
        // Одиночная тень без блика - частый случай, не выбрасываем.
        // Одиночные блики дальше не идут.
        if (!cfg_.require_coupling) {
            out.blobs.insert(out.blobs.end(), cr.uncoupled_dark.begin(), cr.uncoupled_dark.end());
        }

        const size_t accepted = out.blobs.size();
        for (const auto& s : detect_standard(dev, frame_idx)) {
            bool duplicate = false;
            for (size_t i = 0; i < accepted; ++i) {
                if (util::distance(s.centroid, out.blobs[i].centroid) < cfg_.duplicate_distance) {
                    duplicate = true;
                    break;
                }
            }
            if (duplicate) continue;
            out.blobs.push_back(s);
            out.standard++;
        }

        if (log_.detector_logger) {
            std::cout << "[DET] frame=" << frame_idx
                      << " dark=" << out.dark
                      << " bright=" << out.bright
                      << " coupled=" << out.coupled
                      << " standard=" << out.standard
                      << " total=" << out.blobs.size()
                      << std::endl;
        }
        return out;
    }

} // namespace detect
