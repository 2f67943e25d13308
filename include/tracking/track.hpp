// ============= include/tracking/track.hpp =============
#pragma once
#include "tracking/motion_model.hpp"

enum class TrackState {
    Tentative,
    Confirmed,
    Lost,
    Removed
};

const char* to_string(TrackState state);

struct Track {
    int id;
    TrackState state;
    MotionState motion;

    cv::Rect2f box;          // última caja asociada
    float confidence;
    bool quality_ok;

    int age;                 // frames desde la creación
    int hits;                // frames asociados en total
    int consecutive_hits;
    int consecutive_misses;
    int time_since_update;

    Track()
        : id(-1), state(TrackState::Tentative), confidence(0.0f), quality_ok(false),
          age(0), hits(0), consecutive_hits(0), consecutive_misses(0),
          time_since_update(0) {}

    bool is_live() const { return state != TrackState::Removed; }
};
