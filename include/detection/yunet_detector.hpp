// ============= include/detection/yunet_detector.hpp =============
/*
 * YuNet Face Detector - OpenCV objdetect
 *
 * CARACTERÍSTICAS:
 * - Wrapper de cv::FaceDetectorYN (modelo ONNX)
 * - El tamaño de entrada se ajusta al frame en cada llamada
 * - quality_ok = false para rostros menores a min_face_size
 *
 * OUTPUT de YuNet (por fila): x, y, w, h, 5 landmarks (x, y), score
 * Landmarks: ojo derecho, ojo izquierdo, nariz, boca derecha, boca izquierda
 */

#pragma once
#include "detection/detector.hpp"
#include <opencv2/objdetect.hpp>
#include <array>
#include <string>

struct FaceLandmarks {
    std::array<cv::Point2f, 5> points;
    float score;
};

class YuNetDetector : public FaceDetector {
public:
    YuNetDetector(const std::string& model_path,
                  float conf_threshold = 0.6f,
                  float nms_threshold = 0.3f,
                  int min_face_size = 40);

    std::vector<Detection> detect(const cv::Mat& frame) override;

    // Detecciones crudas con landmarks (usado por el estimador de pose)
    std::vector<FaceLandmarks> detect_landmarks(const cv::Mat& image);

    void set_conf_threshold(float threshold);
    void set_min_face_size(int size) { min_face_size = size; }

private:
    cv::Ptr<cv::FaceDetectorYN> model;
    float conf_threshold;
    float nms_threshold;
    int min_face_size;

    cv::Mat run(const cv::Mat& image);
};
