#pragma once
#include <opencv2/opencv.hpp>
#include <string>

namespace core {

// Приёмник готовых кадров (аннотированное видео, видео после вычитания фона).
class FrameSink {
public:
    virtual ~FrameSink() = default;
    virtual void write(const cv::Mat& frame) = 0;
};

class VideoFrameSink : public FrameSink {
public:
    VideoFrameSink(const std::string& path, double fps, const cv::Size& size,
                   const std::string& fourcc = "mp4v");
    ~VideoFrameSink() override;

    bool is_open() const { return writer_.isOpened(); }
    void write(const cv::Mat& frame) override;

private:
    cv::VideoWriter writer_;
};

} // namespace core
