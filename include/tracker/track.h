#pragma once
#include <opencv2/core.hpp>
#include <optional>
#include <vector>

// Трек одного предполагаемого организма.
// Параллельные последовательности frames/bboxes/centroids/areas/confidences
// всегда одной длины, индексы кадров строго возрастают.
struct Track {
    int id = -1; // - идентификатор трека.

    std::vector<int> frames;              // - индексы кадров с детекцией.
    std::vector<cv::Rect> bboxes;         // - bbox детекций.
    std::vector<cv::Point2f> centroids;   // - центроиды детекций.
    std::vector<double> areas;            // - площади детекций.
    std::vector<float> confidences;       // - уверенности детекций.

    int last_seen_frame = 0;                        // - последний кадр с детекцией.
    std::optional<cv::Point2f> last_known_position; // - последняя известная позиция.
    bool is_resting = false;                        // - трек "отдыхает" (нет детекции в этом кадре).
    std::optional<cv::Rect> rest_roi;               // - квадрат зоны покоя вокруг last_known_position.
    int frames_since_detection = 0;                 // - кадров подряд без детекции.

    std::vector<cv::Point2f> position_history;      // - полный след для отрисовки.

    int coupled_detections = 0; // - детекции типа coupled.
    int total_detections = 0;   // - все детекции.

    bool is_valid = false; // - итог валидации.

    int length() const { return (int)frames.size(); }

    // Сумма расстояний между соседними центроидами.
    double displacement() const;

    // displacement / (length - 1), 0 при length < 2.
    double avg_speed() const;

    // last_frame - first_frame + 1, включая паузы.
    int total_duration() const;

    // Число разрывов между соседними кадрами (> 1).
    int rest_periods() const;

    // Доля coupled-детекций, проценты.
    double coupling_rate() const;
};

// Плоские числа для сериализации/отчётов (без типов OpenCV).
struct TrackMetrics {
    int track_id = -1;
    int length = 0;
    double displacement = 0.0;
    double avg_speed = 0.0;
    int total_duration = 0;
    int rest_periods = 0;
    double coupling_rate = 0.0;
    int coupled_detections = 0;
    int total_detections = 0;
    int first_frame = -1;
    int last_frame = -1;
    bool is_valid = false;
};

TrackMetrics summarize(const Track& t);
