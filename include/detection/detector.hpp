// ============= include/detection/detector.hpp =============
/*
 * Face Detector - Interfaz del detector externo
 *
 * CONTRATO:
 * - detect(frame) -> lista de {box, confidence, quality_ok}
 * - Puede retornar cero detecciones
 * - No debe bloquear indefinidamente (el timeout lo aplica el pipeline)
 *
 * quality_ok = false marca rostros demasiado pequeños u oblicuos:
 * mantienen vivo un track existente pero nunca crean uno nuevo
 * ni disparan re-identificación.
 */

#pragma once
#include <opencv2/opencv.hpp>
#include <vector>

struct Detection {
    cv::Rect2f box;
    float confidence;
    bool quality_ok;

    Detection() : confidence(0.0f), quality_ok(true) {}
    Detection(const cv::Rect2f& box, float confidence, bool quality_ok = true)
        : box(box), confidence(confidence), quality_ok(quality_ok) {}
};

class FaceDetector {
public:
    virtual ~FaceDetector() = default;

    virtual std::vector<Detection> detect(const cv::Mat& frame) = 0;
};
