#pragma once

#include <string>
#include <string_view>
#include <stdexcept>
#include <cstdint>
#include <toml++/toml.h>   // ОБЯЗАТЕЛЬНО, forward-decl НЕЛЬЗЯ


template <typename T>
static T read_required(const toml::table &tbl, std::string_view key) {
    const auto *node = tbl.get(key);
    if (!node) {
        throw std::runtime_error("missing key " + std::string(key));
    }
    const auto value = node->value<T>();
    if (!value) {
        throw std::runtime_error("invalid value for " + std::string(key));
    }
    return *value;
}


// ----------------------------- [detection] ----------------------------
struct DetectionConfig {
    int threshold = 30;            // - симметричный порог |deviation| для "standard" сегментации.
    int dark_threshold = 10;       // - порог для тёмных пятен (тени), deviation < -dark_threshold.
    int bright_threshold = 25;     // - порог для светлых пятен (блики), deviation > bright_threshold.
    int min_area = 30;             // - минимальная площадь компоненты (пиксели).
    int max_area = 2000;           // - максимальная площадь компоненты (пиксели).
    float min_circularity = 0.3f;  // - нижняя граница 4*pi*area/perimeter^2.
    float max_aspect_ratio = 3.0f; // - max(w,h)/min(w,h).
    int morph_kernel_size = 5;     // - размер эллиптического ядра для close/open.
    float coupling_distance = 100.0f; // - радиус связывания тень-блик (пиксели).
    bool require_coupling = false; // - если true, одиночные тени не выдаются.
    float coupling_boost = 1.3f;   // - множитель уверенности для связанных пятен.
    float duplicate_distance = 20.0f; // - радиус подавления "standard" дублей.
};

// ----------------------------- [tracking] -----------------------------
struct TrackingConfig {
    float max_distance = 50.0f;    // - максимальная дистанция сопоставления (пиксели).
    int max_skip_frames = 60;      // - сколько кадров трек может жить без детекции.
    float rest_zone_radius = 100.0f; // - радиус зоны покоя вокруг последней позиции.
};

// ---------------------------- [validation] ----------------------------
struct ValidationConfig {
    int min_track_length = 5;        // - минимум детекций в треке.
    float min_displacement = 10.0f;  // - минимальный суммарный путь (пиксели).
    float min_speed = 0.1f;          // - минимальная средняя скорость (пикс/детекция).
    float max_speed = 30.0f;         // - максимальная средняя скорость (пикс/детекция).
};

// ---------------------------- [background] ----------------------------
struct BackgroundConfig {
    int sample_every_nth_frame = 3;  // - шаг выборки кадров для фона.
    int max_frames_in_memory = 150;  // - предел буфера для медианы.
    std::string method = "auto";     // - "auto" | "mean" | "median".
};

// ---------------------------- [processing] ----------------------------
struct ProcessingConfig {
    int frame_stride = 3;            // - обрабатывается каждый N-й кадр.
    double duration_seconds = 0.0;   // - ограничение длительности клипа (0 = весь клип).
    int max_frames = 0;              // - ограничение по числу сырых кадров (0 = нет).
    int blur_kernel_size = 5;        // - размер ядра GaussianBlur (нечётный).
    int progress_every_n_frames = 50; // - период прогресс-лога (обработанные кадры).
};

struct OverlayConfig {
    int trail_thickness = 2;         // - толщина линии следа.
    int max_dot_radius = 2;          // - радиус самой свежей точки следа.
    bool show_labels = true;         // - подписи "ID:n (xx% coupled)".
};

struct LoggingConfig {
    bool background_logger = true;
    bool detector_logger = false;
    bool tracker_logger = false;
    bool pipeline_logger = true;
};

struct AppConfig {
    DetectionConfig detection;
    TrackingConfig tracking;
    ValidationConfig validation;
    BackgroundConfig background;
    ProcessingConfig processing;
    OverlayConfig overlay;
    LoggingConfig logging;
};

bool load_detection_config(const toml::table &tbl, DetectionConfig &cfg);
bool load_tracking_config(const toml::table &tbl, TrackingConfig &cfg);
bool load_validation_config(const toml::table &tbl, ValidationConfig &cfg);
bool load_background_config(const toml::table &tbl, BackgroundConfig &cfg);
bool load_processing_config(const toml::table &tbl, ProcessingConfig &cfg);
bool load_overlay_config(const toml::table &tbl, OverlayConfig &cfg);
bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg);

// Загружает все секции; секции с ошибками остаются с дефолтами.
AppConfig load_app_config(const toml::table &tbl);

// Читает файл и загружает конфиг. Ошибка парсинга файла -> ConfigurationError.
AppConfig load_app_config_file(const std::string &path);
