#include "tracker/track_validator.h"

TrackValidator::TrackValidator(const ValidationConfig& cfg) : cfg_(cfg) {}

bool TrackValidator::length_ok(const Track& t) const {
    // одна детекция: путь и скорость не определены
    if (t.length() < 2) return false;
    return t.length() >= cfg_.min_track_length;
}

bool TrackValidator::displacement_ok(const Track& t) const {
    return t.displacement() >= cfg_.min_displacement;
}

bool TrackValidator::speed_ok(const Track& t) const {
    const double v = t.avg_speed();
    return v >= cfg_.min_speed && v <= cfg_.max_speed;
}

bool TrackValidator::is_valid(const Track& t) const {
    if (!length_ok(t)) return false;
    if (!displacement_ok(t)) return false;
    if (!speed_ok(t)) return false;
    return true;
}

int TrackValidator::validate(std::vector<Track>& tracks) const {
    int valid = 0;
    for (auto& t : tracks) {
        t.is_valid = is_valid(t);
        if (t.is_valid) valid++;
    }
    return valid;
}
