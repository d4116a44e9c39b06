#pragma once

#include <vector>

#include "config.h"
#include "tracker/track.h"

// Проверка качества завершённых треков.
// Трек валиден, если: длина >= 2 и >= min_track_length, суммарный путь
// >= min_displacement, средняя скорость в [min_speed, max_speed].
class TrackValidator {
public:
    explicit TrackValidator(const ValidationConfig& cfg);

    bool is_valid(const Track& t) const;

    // Выставляет is_valid для каждого трека, возвращает число валидных.
    int validate(std::vector<Track>& tracks) const;

    bool length_ok(const Track& t) const;
    bool displacement_ok(const Track& t) const;
    bool speed_ok(const Track& t) const;

    const ValidationConfig& config() const { return cfg_; }

private:
    ValidationConfig cfg_;
};
