#pragma once
#include <opencv2/core.hpp>
#include <optional>
#include <string>

namespace detect {

enum class BlobKind : int {
    Standard = 0,  // - общая сегментация по |deviation|.
    Dark,          // - тень.
    Bright,        // - блик.
    Coupled        // - тень, подтверждённая бликом.
};

const char* to_string(BlobKind kind);

// Детекция в одном кадре. После создания не меняется.
struct Blob {
    int frame_idx = 0;                // - индекс обработанного кадра.
    cv::Rect bbox;                    // - bbox компоненты.
    cv::Point2f centroid{0.f, 0.f};   // - субпиксельный центроид.
    double area = 0.0;                // - площадь (пиксели).
    float circularity = 0.f;          // - 4*pi*area/perimeter^2, [0,1].
    float aspect_ratio = 1.f;         // - max(w,h)/min(w,h).
    float confidence = 1.f;           // - уверенность (= circularity, x boost для coupled).
    BlobKind kind = BlobKind::Standard;
    std::optional<int> coupled_with;  // - индекс bright-пятна в списке кадра (только для справки).
};

} // namespace detect
