#include "pipeline/frame_preprocessor.h"
#include "core/errors.h"

#include <algorithm>

namespace pipeline {

FramePreprocessor::FramePreprocessor(const cv::Mat& background, int blur_kernel_size) {
    background.convertTo(background_, CV_MAKETYPE(CV_32F, background.channels()));
    blur_ = std::max(1, blur_kernel_size);
    if (blur_ % 2 == 0) blur_ += 1;
}

FramePreprocessor::Output FramePreprocessor::process(const cv::Mat& frame) const {
    if (frame.size() != background_.size() || frame.channels() != background_.channels()) {
        throw core::SourceReadError("frame " + std::to_string(frame.cols) + "x" +
                                    std::to_string(frame.rows) + "x" + std::to_string(frame.channels()) +
                                    " does not match background " +
                                    std::to_string(background_.cols) + "x" +
                                    std::to_string(background_.rows) + "x" +
                                    std::to_string(background_.channels()));
    }

    Output out;

    cv::Mat f;
    frame.convertTo(f, background_.type());
    cv::Mat diff = f - background_;
    // +128: нулевое отклонение = средне-серый, convertTo насыщает до [0,255]
    diff.convertTo(out.shifted, CV_MAKETYPE(CV_8U, diff.channels()), 1.0, 128.0);

    cv::Mat gray;
    if (out.shifted.channels() == 3) {
        cv::cvtColor(out.shifted, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = out.shifted;
    }

    cv::Mat blurred;
    cv::GaussianBlur(gray, blurred, cv::Size(blur_, blur_), 0);
    blurred.convertTo(out.deviation, CV_32F, 1.0, -128.0);
    return out;
}

} // namespace pipeline
