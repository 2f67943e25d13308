// ============= include/utils.hpp =============
#pragma once
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

// "a, b ,c" -> {"a", "b", "c"} (descarta vacíos)
std::vector<std::string> split_list(const std::string& list, char sep = ',');

// "0", "1", ... -> índice de cámara
bool is_camera_index(const std::string& source);

// Abrir captura con reintentos
// - índice numérico: cámara local
// - "rtsp://...": FFMPEG con timeouts
// - otro: archivo de video
cv::VideoCapture open_cap(const std::string& source, int retries = 5);
