#pragma once
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace core {

struct SourceInfo {
    double fps = 0.0;      // - исходный FPS.
    int width = 0;         // - ширина кадра.
    int height = 0;        // - высота кадра.
    int frame_count = 0;   // - заявленное число кадров (0 = неизвестно).
};

// Последовательный источник кадров клипа.
//  read():   true  - кадр получен,
//            false - конец потока (в т.ч. недочитанный кадр),
//            SourceReadError - поломка декодера посреди клипа.
//  rewind(): вернуться к первому кадру (фон и детекция - два прохода).
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual SourceInfo info() const = 0;
    virtual bool read(cv::Mat& out) = 0;
    virtual void rewind() = 0;
};

class VideoFrameSource : public FrameSource {
public:
    explicit VideoFrameSource(const std::string& path);

    SourceInfo info() const override { return info_; }
    bool read(cv::Mat& out) override;
    void rewind() override;

private:
    void open();

    std::string path_;
    cv::VideoCapture cap_;
    SourceInfo info_;
    int read_index_ = 0;
};

// Кадры из памяти (синтетические клипы, тесты).
class MatFrameSource : public FrameSource {
public:
    explicit MatFrameSource(std::vector<cv::Mat> frames, double fps = 30.0);

    SourceInfo info() const override;
    bool read(cv::Mat& out) override;
    void rewind() override { pos_ = 0; }

private:
    std::vector<cv::Mat> frames_;
    double fps_;
    size_t pos_ = 0;
};

} // namespace core
