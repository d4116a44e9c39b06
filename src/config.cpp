#include <toml++/toml.h>   // ДОЛЖНО БЫТЬ ПЕРВЫМ
#include "config.h"
#include "core/errors.h"
#include <iostream>
#include <stdexcept>
#include <string_view>


// ============================================================================
// Загрузка config.toml
//
// Важно:
//  - Ошибка в одной секции не "убивает" приложение.
//  - Для секции с ошибкой остаются дефолты и loader возвращает false.
//  - Имена ключей совпадают с config.toml.
// ============================================================================

static const toml::table &require_table(const toml::table &tbl, std::string_view name) {
    const auto *node = tbl.get(name);
    if (!node) {
        throw std::runtime_error("missing [" + std::string(name) + "] table");
    }
    const auto *t = node->as_table();
    if (!t) {
        throw std::runtime_error("invalid [" + std::string(name) + "] table");
    }
    return *t;
}

bool load_detection_config(const toml::table &tbl, DetectionConfig &cfg) {
    // ----------------------------- [detection] ----------------------------
    try {
        const auto &det = require_table(tbl, "detection");
        DetectionConfig c;
        c.threshold = read_required<int>(det, "threshold");
        c.dark_threshold = read_required<int>(det, "dark_threshold");
        c.bright_threshold = read_required<int>(det, "bright_threshold");
        c.min_area = read_required<int>(det, "min_area");
        c.max_area = read_required<int>(det, "max_area");
        c.min_circularity = read_required<float>(det, "min_circularity");
        c.max_aspect_ratio = read_required<float>(det, "max_aspect_ratio");
        c.morph_kernel_size = read_required<int>(det, "morph_kernel_size");
        c.coupling_distance = read_required<float>(det, "coupling_distance");
        c.require_coupling = read_required<bool>(det, "require_coupling");
        c.coupling_boost = read_required<float>(det, "coupling_boost");
        c.duplicate_distance = read_required<float>(det, "duplicate_distance");
        if (c.min_area > c.max_area) {
            throw std::runtime_error("min_area > max_area");
        }
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "detection config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_tracking_config(const toml::table &tbl, TrackingConfig &cfg) {
    // ----------------------------- [tracking] -----------------------------
    try {
        const auto &trk = require_table(tbl, "tracking");
        TrackingConfig c;
        c.max_distance = read_required<float>(trk, "max_distance");
        c.max_skip_frames = read_required<int>(trk, "max_skip_frames");
        c.rest_zone_radius = read_required<float>(trk, "rest_zone_radius");
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "tracking config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_validation_config(const toml::table &tbl, ValidationConfig &cfg) {
    // ---------------------------- [validation] ----------------------------
    try {
        const auto &val = require_table(tbl, "validation");
        ValidationConfig c;
        c.min_track_length = read_required<int>(val, "min_track_length");
        c.min_displacement = read_required<float>(val, "min_displacement");
        c.min_speed = read_required<float>(val, "min_speed");
        c.max_speed = read_required<float>(val, "max_speed");
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "validation config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_background_config(const toml::table &tbl, BackgroundConfig &cfg) {
    // ---------------------------- [background] ----------------------------
    try {
        const auto &bg = require_table(tbl, "background");
        BackgroundConfig c;
        c.sample_every_nth_frame = read_required<int>(bg, "sample_every_nth_frame");
        c.max_frames_in_memory = read_required<int>(bg, "max_frames_in_memory");
        c.method = read_required<std::string>(bg, "method");
        if (c.method != "auto" && c.method != "mean" && c.method != "median") {
            throw std::runtime_error("unknown method " + c.method);
        }
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "background config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_processing_config(const toml::table &tbl, ProcessingConfig &cfg) {
    // ---------------------------- [processing] ----------------------------
    try {
        const auto &proc = require_table(tbl, "processing");
        ProcessingConfig c;
        c.frame_stride = read_required<int>(proc, "frame_stride");
        c.duration_seconds = read_required<double>(proc, "duration_seconds");
        c.max_frames = read_required<int>(proc, "max_frames");
        c.blur_kernel_size = read_required<int>(proc, "blur_kernel_size");
        c.progress_every_n_frames = read_required<int>(proc, "progress_every_n_frames");
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "processing config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_overlay_config(const toml::table &tbl, OverlayConfig &cfg) {
    // ----------------------------- [overlay] ------------------------------
    try {
        const auto &ov = require_table(tbl, "overlay");
        OverlayConfig c;
        c.trail_thickness = read_required<int>(ov, "trail_thickness");
        c.max_dot_radius = read_required<int>(ov, "max_dot_radius");
        c.show_labels = read_required<bool>(ov, "show_labels");
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "overlay config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg) {
    // ----------------------------- [logging] ------------------------------
    try {
        const auto &logging = require_table(tbl, "logging");
        LoggingConfig c;
        c.background_logger = read_required<bool>(logging, "background_logger");
        c.detector_logger = read_required<bool>(logging, "detector_logger");
        c.tracker_logger = read_required<bool>(logging, "tracker_logger");
        c.pipeline_logger = read_required<bool>(logging, "pipeline_logger");
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "logging config load failed  " << e.what() << std::endl;
        return false;
    }
}

AppConfig load_app_config(const toml::table &tbl) {
    AppConfig cfg;
    load_detection_config(tbl, cfg.detection);
    load_tracking_config(tbl, cfg.tracking);
    load_validation_config(tbl, cfg.validation);
    load_background_config(tbl, cfg.background);
    load_processing_config(tbl, cfg.processing);
    load_overlay_config(tbl, cfg.overlay);
    load_logging_config(tbl, cfg.logging);
    return cfg;
}

AppConfig load_app_config_file(const std::string &path) {
    try {
        toml::table tbl = toml::parse_file(path);
        return load_app_config(tbl);
    } catch (const toml::parse_error &e) {
        throw core::ConfigurationError("cannot parse " + path + ": " + std::string(e.description()));
    }
}
