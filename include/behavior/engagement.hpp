// ============= include/behavior/engagement.hpp =============
/*
 * Engagement - clasificación a partir de la pose de la cabeza
 *
 * NIVELES:
 * - High:    |yaw| <= yaw_threshold y pitch >= pitch_threshold
 * - Low:     |yaw| > factor * yaw_threshold o pitch < factor * pitch_threshold
 * - Medium:  el resto
 * - Unknown: sin pose (o ángulos no finitos)
 *
 * pitch negativo = mirando hacia abajo.
 */

#pragma once
#include <optional>
#include <string>

struct HeadPose;

enum class Engagement {
    High,
    Medium,
    Low,
    Unknown
};

struct EngagementThresholds {
    float yaw = 20.0f;          // grados
    float pitch = -10.0f;       // grados
    float medium_factor = 1.5f;

    void validate() const;
};

Engagement classify_engagement(float pitch, float yaw,
                               const EngagementThresholds& thresholds = EngagementThresholds());

Engagement classify_engagement(const std::optional<HeadPose>& pose,
                               const EngagementThresholds& thresholds = EngagementThresholds());

const char* to_string(Engagement level);
