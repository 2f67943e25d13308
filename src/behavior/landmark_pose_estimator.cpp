// ============= src/behavior/landmark_pose_estimator.cpp =============
#include "behavior/landmark_pose_estimator.hpp"
#include "tracking/geometry.hpp"
#include <opencv2/calib3d.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace {

// Modelo 3D canónico en el sistema de la cámara (x derecha, y abajo, z adelante).
// Mismo orden que los landmarks de YuNet.
const std::vector<cv::Point3d> MODEL_POINTS = {
    {-225.0, -170.0, 135.0},   // ojo derecho (lado izquierdo de la imagen)
    { 225.0, -170.0, 135.0},   // ojo izquierdo
    {   0.0,    0.0,   0.0},   // punta de la nariz
    {-150.0,  150.0, 125.0},   // comisura derecha
    { 150.0,  150.0, 125.0},   // comisura izquierda
};

}  // namespace

LandmarkPoseEstimator::LandmarkPoseEstimator(std::unique_ptr<YuNetDetector> landmark_detector,
                                             float crop_margin)
    : landmark_detector(std::move(landmark_detector)),
      crop_margin(crop_margin)
{
    if (!this->landmark_detector) {
        throw std::invalid_argument("LandmarkPoseEstimator requires a landmark detector");
    }
}

std::optional<HeadPose> LandmarkPoseEstimator::estimate(const cv::Mat& frame, const cv::Rect2f& box) {
    cv::Rect2f expanded(box.x - box.width * crop_margin,
                        box.y - box.height * crop_margin,
                        box.width * (1.0f + 2.0f * crop_margin),
                        box.height * (1.0f + 2.0f * crop_margin));

    cv::Rect roi = clip_box(expanded, frame.size());
    if (roi.width < 8 || roi.height < 8) {
        return std::nullopt;
    }

    cv::Mat crop = frame(roi).clone();
    auto faces = landmark_detector->detect_landmarks(crop);
    if (faces.empty()) {
        return std::nullopt;
    }

    auto best = std::max_element(faces.begin(), faces.end(),
        [](const FaceLandmarks& a, const FaceLandmarks& b) { return a.score < b.score; });

    std::vector<cv::Point2d> image_points;
    for (const auto& p : best->points) {
        image_points.emplace_back(p.x, p.y);
    }

    const double focal = crop.cols;
    cv::Matx33d camera(focal, 0.0, crop.cols / 2.0,
                       0.0, focal, crop.rows / 2.0,
                       0.0, 0.0, 1.0);

    cv::Mat rvec, tvec;
    bool ok = cv::solvePnP(MODEL_POINTS, image_points, camera, cv::noArray(),
                           rvec, tvec, false, cv::SOLVEPNP_EPNP);
    if (!ok) {
        return std::nullopt;
    }

    cv::Matx33d rotation;
    cv::Rodrigues(rvec, rotation);

    HeadPose pose = pose_from_rotation(rotation);
    // Rotación positiva sobre x (y hacia abajo) = cabeza inclinada hacia abajo
    pose.pitch = -pose.pitch;
    return pose;
}
