#pragma once
#include <opencv2/opencv.hpp>

#include <vector>

#include "config.h"
#include "detect/blob.h"

namespace detect {

    // Сегментация кадра отклонений (deviation = blurred_gray - 128) на пятна.
    //
    // Три независимых маски:
    //  - dark:     deviation < -dark_threshold   (тень)
    //  - bright:   deviation >  bright_threshold (блик)
    //  - standard: |deviation| > threshold       (общее движение)
    // Каждая маска: close -> open эллиптическим ядром, затем 8-связные компоненты
    // и фильтры в порядке area -> aspect ratio -> circularity.
    class BlobDetector {
    public:
        struct FrameDetections {
            std::vector<Blob> blobs;   // итоговый список для трекера
            int dark = 0;              // тени до связывания
            int bright = 0;            // блики до связывания
            int coupled = 0;           // пары тень-блик
            int standard = 0;          // принятые standard (после подавления дублей)
        };

        BlobDetector(const DetectionConfig& cfg, const LoggingConfig& log);

        // Полный проход: dark/bright -> связывание -> standard без дублей.
        FrameDetections detect(const cv::Mat& deviation, int frame_idx) const;

        std::vector<Blob> detect_dark(const cv::Mat& deviation, int frame_idx) const;
        std::vector<Blob> detect_bright(const cv::Mat& deviation, int frame_idx) const;
        std::vector<Blob> detect_standard(const cv::Mat& deviation, int frame_idx) const;

        // Компоненты бинарной маски (255 = передний план), с фильтрами.
        std::vector<Blob> extract_blobs(const cv::Mat& binary, int frame_idx, BlobKind kind) const;

        // Фильтры, по отдельности.
        bool area_ok(double area) const;
        bool aspect_ratio_ok(float aspect_ratio) const;
        bool circularity_ok(float circularity) const;

        // CV_8U (середина 128) или знаковый float -> одноканальный CV_32F deviation.
        static cv::Mat to_deviation(const cv::Mat& frame);

        // Периметр внешнего контура компоненты (пиксели).
        static double component_perimeter(const cv::Mat& component_mask);

    private:
        cv::Mat clean_mask(const cv::Mat& mask) const;

    private:
        DetectionConfig cfg_;
        LoggingConfig log_;
        cv::Mat kernel_;
    };

} // namespace detect
