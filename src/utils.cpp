// ============= src/utils.cpp =============
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>

std::vector<std::string> split_list(const std::string& list, char sep) {
    std::vector<std::string> items;
    std::stringstream ss(list);
    std::string item;

    while (std::getline(ss, item, sep)) {
        auto start = item.find_first_not_of(" \t\"");
        if (start == std::string::npos) continue;
        auto end = item.find_last_not_of(" \t\"");
        items.push_back(item.substr(start, end - start + 1));
    }
    return items;
}

bool is_camera_index(const std::string& source) {
    return !source.empty() &&
           std::all_of(source.begin(), source.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

namespace {

bool try_open(cv::VideoCapture& cap, const std::string& source) {
    if (is_camera_index(source)) {
        return cap.open(std::stoi(source));
    }

    if (source.rfind("rtsp://", 0) == 0) {
        return cap.open(source, cv::CAP_FFMPEG, {
            cv::CAP_PROP_OPEN_TIMEOUT_MSEC, 20000,        // 20s timeout
            cv::CAP_PROP_READ_TIMEOUT_MSEC, 20000,        // 20s read timeout
        });
    }

    return cap.open(source);
}

}  // namespace

cv::VideoCapture open_cap(const std::string& source, int retries) {
    cv::VideoCapture cap;

    spdlog::info("intentando abrir {}...", source);

    for (int i = 0; i < retries; ++i) {
        spdlog::info("intento {}/{}...", i + 1, retries);

        if (try_open(cap, source) && cap.isOpened()) {
            double fps = cap.get(cv::CAP_PROP_FPS);
            int width = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH));
            int height = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT));

            spdlog::info("✓ fuente abierta");
            spdlog::info("  resolución: {}x{}", width, height);
            spdlog::info("  fps reportado: {:.1f}", fps > 0 ? fps : 0.0);
            return cap;
        }

        cap.release();

        if (i < retries - 1) {
            int wait_time = std::min(2 + i, 8);
            spdlog::warn("intento {}/{} fallido. reintentando en {}s...", i + 1, retries, wait_time);
            std::this_thread::sleep_for(std::chrono::seconds(wait_time));
        }
    }

    spdlog::error("✗ no se pudo abrir {} después de {} intentos", source, retries);
    throw std::runtime_error("no se pudo abrir la fuente de video: " + source);
}
