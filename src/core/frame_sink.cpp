#include "core/frame_sink.h"
#include <iostream>

namespace core {

VideoFrameSink::VideoFrameSink(const std::string& path, double fps, const cv::Size& size,
                               const std::string& fourcc) {
    const std::string cc = fourcc.size() == 4 ? fourcc : std::string("mp4v");
    int code = cv::VideoWriter::fourcc(cc[0], cc[1], cc[2], cc[3]);
    if (!writer_.open(path, code, fps, size)) {
        // Не фатально: трекинг продолжается без записи видео.
        std::cerr << "[SINK] could not create video writer " << path << std::endl;
    }
}

VideoFrameSink::~VideoFrameSink() {
    writer_.release();
}

void VideoFrameSink::write(const cv::Mat& frame) {
    if (writer_.isOpened()) {
        writer_.write(frame);
    }
}

} // namespace core
