#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "config.h"
#include "core/frame_source.h"

namespace background {

struct BackgroundMetadata {
    double fps = 0.0;          // - исходный FPS.
    int width = 0;             // - ширина кадра.
    int height = 0;            // - высота кадра.
    int total_frames = 0;      // - число кадров по данным источника.
    int frames_used = 0;       // - сколько кадров реально вошло в фон.
    int stride = 1;            // - шаг выборки.
    std::string method;        // - "mean" или "median" (фактически использованный).
};

struct BackgroundResult {
    cv::Mat reference;         // - CV_32FC(n), опорный кадр.
    BackgroundMetadata meta;
};

// Оценка статического фона по клипу.
//
//  mean   - бегущее среднее avg += (frame - avg) / n в double, без хранения клипа;
//  median - поэлементная медиана буфера (устойчивее к медленным объектам);
//  auto   - буфер до max_frames_in_memory, при переполнении переход на бегущее среднее.
class BackgroundEstimator {
public:
    BackgroundEstimator(const BackgroundConfig& cfg, const LoggingConfig& log);

    // frame_cap: ограничение по числу сырых кадров (0 = весь клип).
    // Ноль отобранных кадров -> core::ConfigurationError.
    BackgroundResult estimate(core::FrameSource& source, int frame_cap = 0) const;

    static int frame_cap_for(double fps, double duration_seconds, int max_frames);

    // Шаг выборки с учётом лимита памяти: если клип (frame_count, обрезанный
    // frame_cap) даёт больше mem_cap выборок, шаг = total / mem_cap.
    // frame_count <= 0 (неизвестно) -> шаг без изменений.
    static int sampling_stride(int stride, int mem_cap, int frame_count, int frame_cap = 0);

    // Поэлементная медиана набора кадров одинакового размера, результат CV_32F.
    static cv::Mat median_of(const std::vector<cv::Mat>& frames);

private:
    class RunningMean {
    public:
        void add(const cv::Mat& frame);
        int count() const { return n_; }
        cv::Mat result() const;
    private:
        cv::Mat avg_;      // CV_64F
        int n_ = 0;
    };

    BackgroundConfig cfg_;
    LoggingConfig log_;
};

} // namespace background
