// ============= include/behavior/landmark_pose_estimator.hpp =============
/*
 * Landmark Pose Estimator - YuNet landmarks + solvePnP
 *
 * CARACTERÍSTICAS:
 * - Recorta el rostro con margen y corre YuNet sobre el recorte
 * - 5 landmarks (ojos, nariz, comisuras) contra un modelo 3D canónico
 * - Cámara aproximada: focal = ancho del recorte, centro óptico al centro
 * - Sin landmarks o sin convergencia -> nullopt
 *
 * Convención: pitch negativo = mirando hacia abajo.
 */

#pragma once
#include "behavior/pose_estimator.hpp"
#include "detection/yunet_detector.hpp"
#include <memory>

class LandmarkPoseEstimator : public PoseEstimator {
public:
    // El detector no se comparte con el stage de detección
    explicit LandmarkPoseEstimator(std::unique_ptr<YuNetDetector> landmark_detector,
                                   float crop_margin = 0.2f);

    std::optional<HeadPose> estimate(const cv::Mat& frame, const cv::Rect2f& box) override;

private:
    std::unique_ptr<YuNetDetector> landmark_detector;
    float crop_margin;
};
