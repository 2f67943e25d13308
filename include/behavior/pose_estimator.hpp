// ============= include/behavior/pose_estimator.hpp =============
/*
 * Pose Estimator - Interfaz del estimador de pose externo
 *
 * CONTRATO:
 * - estimate(frame, box) -> {pitch, yaw, roll} en grados, o nullopt
 *   si no hay landmarks / el solver no converge
 * - Puede lanzar; el pipeline lo trata como fallo transitorio
 */

#pragma once
#include <opencv2/opencv.hpp>
#include <optional>

struct HeadPose {
    float pitch;
    float yaw;
    float roll;
};

class PoseEstimator {
public:
    virtual ~PoseEstimator() = default;

    virtual std::optional<HeadPose> estimate(const cv::Mat& frame, const cv::Rect2f& box) = 0;
};

// Euler (pitch, yaw, roll) en grados a partir de una matriz de rotación
HeadPose pose_from_rotation(const cv::Matx33d& rotation);
