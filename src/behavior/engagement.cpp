// ============= src/behavior/engagement.cpp =============
#include "behavior/engagement.hpp"
#include "behavior/pose_estimator.hpp"
#include <cmath>
#include <stdexcept>

void EngagementThresholds::validate() const {
    if (!(yaw > 0.0f)) {
        throw std::invalid_argument("behavior.yaw_threshold must be positive");
    }
    if (!(pitch <= 0.0f)) {
        throw std::invalid_argument("behavior.pitch_threshold must be <= 0");
    }
    if (!(medium_factor >= 1.0f)) {
        throw std::invalid_argument("behavior.medium_factor must be >= 1");
    }
}

Engagement classify_engagement(float pitch, float yaw, const EngagementThresholds& thresholds) {
    if (!std::isfinite(pitch) || !std::isfinite(yaw)) {
        return Engagement::Unknown;
    }

    const float abs_yaw = std::fabs(yaw);

    if (abs_yaw > thresholds.yaw * thresholds.medium_factor ||
        pitch < thresholds.pitch * thresholds.medium_factor) {
        return Engagement::Low;
    }
    if (abs_yaw > thresholds.yaw || pitch < thresholds.pitch) {
        return Engagement::Medium;
    }
    return Engagement::High;
}

Engagement classify_engagement(const std::optional<HeadPose>& pose,
                               const EngagementThresholds& thresholds)
{
    if (!pose) return Engagement::Unknown;
    return classify_engagement(pose->pitch, pose->yaw, thresholds);
}

const char* to_string(Engagement level) {
    switch (level) {
        case Engagement::High:    return "high";
        case Engagement::Medium:  return "medium";
        case Engagement::Low:     return "low";
        case Engagement::Unknown: return "unknown";
    }
    return "unknown";
}
