#pragma once
#include <opencv2/opencv.hpp>

namespace pipeline {

// Вычитание фона и подготовка кадра для детектора:
//  shifted   = clip(frame - background + 128)   CV_8U, исходное число каналов;
//  deviation = GaussianBlur(gray(shifted)) - 128 CV_32FC1, 0 = нет отклонения.
class FramePreprocessor {
public:
    struct Output {
        cv::Mat shifted;
        cv::Mat deviation;
    };

    // background: CV_32FC1 или CV_32FC3. blur_kernel_size приводится к нечётному.
    FramePreprocessor(const cv::Mat& background, int blur_kernel_size);

    // Несовпадение размера/каналов с фоном -> core::SourceReadError.
    Output process(const cv::Mat& frame) const;

private:
    cv::Mat background_;
    int blur_ = 5;
};

} // namespace pipeline
