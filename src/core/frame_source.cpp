#include "core/frame_source.h"
#include "core/errors.h"

namespace core {

VideoFrameSource::VideoFrameSource(const std::string& path) : path_(path) {
    open();
}

void VideoFrameSource::open() {
    cap_.release();
    if (!cap_.open(path_)) {
        throw SourceReadError("could not open video: " + path_);
    }
    info_.fps = cap_.get(cv::CAP_PROP_FPS);
    info_.frame_count = (int)cap_.get(cv::CAP_PROP_FRAME_COUNT);
    info_.width = (int)cap_.get(cv::CAP_PROP_FRAME_WIDTH);
    info_.height = (int)cap_.get(cv::CAP_PROP_FRAME_HEIGHT);
    read_index_ = 0;
}

bool VideoFrameSource::read(cv::Mat& out) {
    // grab() == false: поток закончился (или кадр недочитан) - это не ошибка.
    if (!cap_.grab()) {
        return false;
    }
    if (!cap_.retrieve(out) || out.empty()) {
        throw SourceReadError("decode failed at frame " + std::to_string(read_index_) +
                              " of " + path_);
    }
    read_index_++;
    return true;
}

void VideoFrameSource::rewind() {
    // CAP_PROP_POS_FRAMES ненадёжен для части контейнеров, переоткрываем.
    open();
}

MatFrameSource::MatFrameSource(std::vector<cv::Mat> frames, double fps)
    : frames_(std::move(frames)), fps_(fps) {}

SourceInfo MatFrameSource::info() const {
    SourceInfo si;
    si.fps = fps_;
    si.frame_count = (int)frames_.size();
    if (!frames_.empty()) {
        si.width = frames_.front().cols;
        si.height = frames_.front().rows;
    }
    return si;
}

bool MatFrameSource::read(cv::Mat& out) {
    if (pos_ >= frames_.size()) {
        return false;
    }
    out = frames_[pos_++].clone();
    return true;
}

} // namespace core
