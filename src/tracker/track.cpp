#include "tracker/track.h"
#include "util/geometry.h"

double Track::displacement() const {
    if (centroids.size() < 2) return 0.0;
    double total = 0.0;
    for (size_t i = 1; i < centroids.size(); ++i) {
        total += util::distance(centroids[i - 1], centroids[i]);
    }
    return total;
}

double Track::avg_speed() const {
    if (centroids.size() < 2) return 0.0;
    return displacement() / (double)(centroids.size() - 1);
}

int Track::total_duration() const {
    if (frames.empty()) return 0;
    return frames.back() - frames.front() + 1;
}

int Track::rest_periods() const {
    int n = 0;
    for (size_t i = 1; i < frames.size(); ++i) {
        if (frames[i] - frames[i - 1] > 1) n++;
    }
    return n;
}

double Track::coupling_rate() const {
    if (total_detections == 0) return 0.0;
    return 100.0 * (double)coupled_detections / (double)total_detections;
}

TrackMetrics summarize(const Track& t) {
    TrackMetrics m;
    m.track_id = t.id;
    m.length = t.length();
    m.displacement = t.displacement();
    m.avg_speed = t.avg_speed();
    m.total_duration = t.total_duration();
    m.rest_periods = t.rest_periods();
    m.coupling_rate = t.coupling_rate();
    m.coupled_detections = t.coupled_detections;
    m.total_detections = t.total_detections;
    if (!t.frames.empty()) {
        m.first_frame = t.frames.front();
        m.last_frame = t.frames.back();
    }
    m.is_valid = t.is_valid;
    return m;
}
