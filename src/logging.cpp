// ============= src/logging.cpp =============
#include "logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <memory>
#include <vector>

namespace {

constexpr size_t MAX_LOG_SIZE = 10 * 1024 * 1024;
constexpr size_t MAX_LOG_FILES = 5;

}  // namespace

void setup_logging(const std::string& level, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string file_error;
    if (!log_file.empty()) {
        try {
            std::filesystem::path p(log_file);
            if (!p.parent_path().empty()) {
                std::filesystem::create_directories(p.parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, MAX_LOG_SIZE, MAX_LOG_FILES));
        } catch (const std::exception& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("facepass", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("⚠️  Nivel de log desconocido '{}', usando info", level);
    } else {
        spdlog::set_level(lvl);
    }
    spdlog::flush_on(spdlog::level::warn);

    if (!file_error.empty()) {
        spdlog::warn("⚠️  No se pudo abrir {}: {} (solo consola)", log_file, file_error);
    }
}
