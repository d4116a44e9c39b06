#include "background/background_estimator.h"
#include "core/errors.h"

#include <algorithm>
#include <cmath>
#include <iostream>

/*
    Порядок работы estimate():
    1) читаем клип, берём каждый stride-й сырой кадр (до frame_cap);
    2) median: копим кадры в буфер, на max_frames_in_memory выборка прекращается;
       mean:   сразу бегущее среднее;
       auto:   копим буфер, при переполнении сворачиваем его в бегущее среднее
               и дальше идём инкрементально;
    3) итог приводится к CV_32F только в самом конце.
*/

namespace background {

BackgroundEstimator::BackgroundEstimator(const BackgroundConfig& cfg, const LoggingConfig& log)
    : cfg_(cfg), log_(log) {}

void BackgroundEstimator::RunningMean::add(const cv::Mat& frame) {
    cv::Mat f;
    frame.convertTo(f, CV_MAKETYPE(CV_64F, frame.channels()));
    n_++;
    if (n_ == 1) {
        avg_ = f;
        return;
    }
    avg_ += (f - avg_) / (double)n_;
}

cv::Mat BackgroundEstimator::RunningMean::result() const {
    cv::Mat out;
    avg_.convertTo(out, CV_MAKETYPE(CV_32F, avg_.channels()));
    return out;
}

int BackgroundEstimator::sampling_stride(int stride, int mem_cap, int frame_count, int frame_cap) {
    stride = std::max(1, stride);
    mem_cap = std::max(1, mem_cap);
    int total = frame_count;
    if (frame_cap > 0) {
        total = total > 0 ? std::min(total, frame_cap) : frame_cap;
    }
    // выборка растягивается на весь клип, а не обрывается на первых mem_cap*stride кадрах
    if (total > 0 && total / stride > mem_cap) {
        stride = std::max(stride, total / mem_cap);
    }
    return stride;
}

int BackgroundEstimator::frame_cap_for(double fps, double duration_seconds, int max_frames) {
    int cap = 0;
    if (duration_seconds > 0.0 && fps > 0.0) {
        cap = std::max(1, (int)(fps * duration_seconds));
    }
    if (max_frames > 0) {
        cap = cap > 0 ? std::min(cap, max_frames) : max_frames;
    }
    return cap;
}

cv::Mat BackgroundEstimator::median_of(const std::vector<cv::Mat>& frames) {
    if (frames.empty()) {
        return cv::Mat();
    }
    const int n = (int)frames.size();
    const int rows = frames.front().rows;
    const int channels = frames.front().channels();
    const int elems = (int)frames.front().total() * channels;

    // Каждый кадр - одна строка стека, медиана считается по столбцам.
    cv::Mat stack(n, elems, CV_32F);
    for (int i = 0; i < n; ++i) {
        cv::Mat f;
        frames[i].convertTo(f, CV_MAKETYPE(CV_32F, channels));
        f.reshape(1, 1).copyTo(stack.row(i));
    }

    cv::Mat sorted;
    cv::sort(stack, sorted, cv::SORT_EVERY_COLUMN + cv::SORT_ASCENDING);

    cv::Mat med;
    if (n % 2 == 1) {
        med = sorted.row(n / 2).clone();
    } else {
        med = (sorted.row(n / 2 - 1) + sorted.row(n / 2)) * 0.5;
    }
    return med.reshape(channels, rows).clone();
}

BackgroundResult BackgroundEstimator::estimate(core::FrameSource& source, int frame_cap) const {
    const int mem_cap = std::max(1, cfg_.max_frames_in_memory);
    const core::SourceInfo si = source.info();
    bool use_mean = (cfg_.method == "mean");
    // бегущему среднему буфер не нужен, шаг не растягиваем
    const int stride = use_mean
            ? std::max(1, cfg_.sample_every_nth_frame)
            : sampling_stride(cfg_.sample_every_nth_frame, mem_cap, si.frame_count, frame_cap);
    const bool median_only = (cfg_.method == "median");

    if (log_.background_logger) {
        std::cout << "[BG] video " << si.width << "x" << si.height
                  << " @ " << si.fps << " fps, frames=" << si.frame_count
                  << " stride=" << stride << " method=" << cfg_.method
                  << " cap=" << frame_cap << std::endl;
    }

    std::vector<cv::Mat> buffer;
    RunningMean mean;
    cv::Mat frame;
    cv::Size size;
    int type = -1;
    int raw_index = 0;

    while (frame_cap <= 0 || raw_index < frame_cap) {
        if (!source.read(frame)) {
            break;
        }
        if (raw_index % stride != 0) {
            raw_index++;
            continue;
        }
        raw_index++;

        if (type < 0) {
            size = frame.size();
            type = frame.type();
        } else if (frame.size() != size || frame.type() != type) {
            throw core::SourceReadError("frame " + std::to_string(raw_index - 1) +
                                        " differs in size or type from the first frame");
        }

        if (use_mean) {
            mean.add(frame);
            continue;
        }

        if ((int)buffer.size() < mem_cap) {
            buffer.push_back(frame.clone());
            if (median_only && (int)buffer.size() >= mem_cap) {
                break;
            }
            continue;
        }

        // auto: буфер полон, дальше только бегущее среднее.
        if (log_.background_logger) {
            std::cout << "[BG] memory limit " << mem_cap
                      << " frames reached, switching to running mean" << std::endl;
        }
        for (const auto& b : buffer) {
            mean.add(b);
        }
        buffer.clear();
        buffer.shrink_to_fit();
        mean.add(frame);
        use_mean = true;
    }

    BackgroundResult res;
    res.meta.fps = si.fps;
    res.meta.width = si.width > 0 ? si.width : size.width;
    res.meta.height = si.height > 0 ? si.height : size.height;
    res.meta.total_frames = si.frame_count;
    res.meta.stride = stride;

    if (use_mean) {
        res.meta.frames_used = mean.count();
        res.meta.method = "mean";
    } else {
        res.meta.frames_used = (int)buffer.size();
        res.meta.method = "median";
    }

    if (res.meta.frames_used == 0) {
        throw core::ConfigurationError("no frames sampled for background estimation");
    }

    res.reference = use_mean ? mean.result() : median_of(buffer);

    if (log_.background_logger) {
        std::cout << "[BG] background computed from " << res.meta.frames_used
                  << " frames (" << res.meta.method << ")" << std::endl;
    }
    return res;
}

} // namespace background
