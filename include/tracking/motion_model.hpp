// ============= include/tracking/motion_model.hpp =============
/*
 * Motion Model - Kalman de velocidad constante
 *
 * ESTADO: [cx, cy, a, h, vcx, vcy, va, vh]
 * - cx, cy: centro de la caja
 * - a: aspect ratio (w / h)
 * - h: altura
 * MEDICIÓN: [cx, cy, a, h]
 *
 * CARACTERÍSTICAS:
 * - predict(): avanza un frame, la incertidumbre crece en cada paso sin medición
 * - update(): predict-then-correct con ganancia de Kalman
 * - El ruido de medición se escala con (1 - confidence): detecciones
 *   confiables reducen más la incertidumbre
 * - Funciones puras: el estado entra y sale por valor
 *
 * Ruido de proceso proporcional a la altura de la caja
 * (pesos 1/20 posición, 1/160 velocidad).
 */

#pragma once
#include <opencv2/opencv.hpp>

struct MotionState {
    cv::Matx<float, 8, 1> mean;
    cv::Matx<float, 8, 8> covariance;

    // Desviación estándar combinada de cx, cy, h
    float uncertainty() const;
};

class MotionModel {
public:
    virtual ~MotionModel() = default;

    virtual MotionState initiate(const cv::Rect2f& box) const = 0;
    virtual MotionState predict(const MotionState& state) const = 0;
    virtual MotionState update(const MotionState& state,
                               const cv::Rect2f& observed,
                               float confidence) const = 0;
    virtual cv::Rect2f to_box(const MotionState& state) const = 0;
};

class KalmanBoxModel : public MotionModel {
public:
    KalmanBoxModel(float std_weight_position = 1.0f / 20.0f,
                   float std_weight_velocity = 1.0f / 160.0f);

    MotionState initiate(const cv::Rect2f& box) const override;
    MotionState predict(const MotionState& state) const override;
    MotionState update(const MotionState& state,
                       const cv::Rect2f& observed,
                       float confidence) const override;
    cv::Rect2f to_box(const MotionState& state) const override;

    static cv::Matx<float, 4, 1> to_xyah(const cv::Rect2f& box);

private:
    float std_weight_position;
    float std_weight_velocity;

    cv::Matx<float, 8, 8> transition;    // F
    cv::Matx<float, 4, 8> measurement;   // H
};
