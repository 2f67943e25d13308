// ============= src/behavior/pose_estimator.cpp =============
#include "behavior/pose_estimator.hpp"
#include <cmath>

namespace {

constexpr double RAD2DEG = 180.0 / CV_PI;

}  // namespace

HeadPose pose_from_rotation(const cv::Matx33d& r) {
    const double sy = std::sqrt(r(0, 0) * r(0, 0) + r(1, 0) * r(1, 0));

    double pitch, yaw, roll;
    if (sy >= 1e-6) {
        pitch = std::atan2(r(2, 1), r(2, 2));
        yaw = std::atan2(-r(2, 0), sy);
        roll = std::atan2(r(1, 0), r(0, 0));
    } else {
        // Gimbal lock
        pitch = std::atan2(-r(1, 2), r(1, 1));
        yaw = std::atan2(-r(2, 0), sy);
        roll = 0.0;
    }

    return HeadPose{static_cast<float>(pitch * RAD2DEG),
                    static_cast<float>(yaw * RAD2DEG),
                    static_cast<float>(roll * RAD2DEG)};
}
