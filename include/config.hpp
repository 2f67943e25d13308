// ============= include/config.hpp =============
#pragma once
#include "behavior/engagement.hpp"
#include "database/similarity_index.hpp"
#include "tracking/track_manager.hpp"
#include <map>
#include <string>
#include <vector>

namespace Config {

    // Tracker defaults
    constexpr float DEFAULT_MIN_IOU = 0.3f;
    constexpr float DEFAULT_CREATION_CONFIDENCE = 0.5f;
    constexpr int DEFAULT_MIN_HITS = 3;
    constexpr int DEFAULT_LOST_GRACE_FRAMES = 1;
    constexpr int DEFAULT_MAX_LOST_FRAMES = 30;

    // Recognition defaults (SFace: 128D, cosine distance 0.45 -> similarity 0.55)
    constexpr int DEFAULT_EMBEDDING_DIM = 128;
    constexpr float DEFAULT_ACCEPT_THRESHOLD = 0.55f;
    constexpr const char* DEFAULT_BACKEND = "matrix";
    constexpr int DEFAULT_EMBED_INTERVAL = 15;

    // Behavior defaults (grados)
    constexpr float DEFAULT_YAW_THRESHOLD = 20.0f;
    constexpr float DEFAULT_PITCH_THRESHOLD = -10.0f;
    constexpr float DEFAULT_MEDIUM_FACTOR = 1.5f;
    constexpr int DEFAULT_POSE_INTERVAL = 1;

    // Pipeline defaults
    constexpr int DEFAULT_EXTERNAL_TIMEOUT_MS = 0;

    // Models
    constexpr const char* DEFAULT_DETECTOR_MODEL = "models/face_detection_yunet_2023mar.onnx";
    constexpr const char* DEFAULT_RECOGNIZER_MODEL = "models/face_recognition_sface_2021dec.onnx";
    constexpr float DEFAULT_DETECTOR_CONF = 0.6f;
    constexpr float DEFAULT_DETECTOR_NMS = 0.3f;
    constexpr int DEFAULT_MIN_FACE_SIZE = 40;

    // Storage / logging
    constexpr const char* DEFAULT_DB_PATH = "database/catalog.db";
    constexpr const char* DEFAULT_LOG_LEVEL = "info";
    constexpr const char* DEFAULT_LOG_FILE = "logs/facepass.log";

    // Input
    constexpr int RECONNECT_RETRIES = 5;
    constexpr int RETRY_DELAY_SEC = 2;
}

// ==================== SimpleToml ====================

// Lector TOML mínimo: [section], key = value, comentarios con '#'
class SimpleToml {
private:
    std::map<std::string, std::string> values;

    static std::string trim(const std::string& s);

public:
    bool load(const std::string& filename);
    bool parse(const std::string& content);

    bool has(const std::string& key) const { return values.count(key) > 0; }

    std::string get(const std::string& key, const std::string& def = "") const;
    int get_int(const std::string& key, int def = 0) const;
    float get_float(const std::string& key, float def = 0.0f) const;
    bool get_bool(const std::string& key, bool def = false) const;
};

// ==================== PipelineConfig ====================

struct PipelineConfig {
    TrackerConfig tracker;
    IndexConfig index;
    EngagementThresholds engagement;

    int embed_interval = Config::DEFAULT_EMBED_INTERVAL;
    int pose_interval = Config::DEFAULT_POSE_INTERVAL;
    int external_timeout_ms = Config::DEFAULT_EXTERNAL_TIMEOUT_MS;

    std::string db_path = Config::DEFAULT_DB_PATH;

    std::string detector_model = Config::DEFAULT_DETECTOR_MODEL;
    std::string recognizer_model = Config::DEFAULT_RECOGNIZER_MODEL;
    float detector_conf_threshold = Config::DEFAULT_DETECTOR_CONF;
    float detector_nms_threshold = Config::DEFAULT_DETECTOR_NMS;
    int min_face_size = Config::DEFAULT_MIN_FACE_SIZE;
    bool pose_enabled = true;

    std::string log_level = Config::DEFAULT_LOG_LEVEL;
    std::string log_file = Config::DEFAULT_LOG_FILE;

    std::vector<std::string> sources;
    int reconnect_retries = Config::RECONNECT_RETRIES;
    bool display = false;

    PipelineConfig();

    // Lanza std::invalid_argument si algún valor está fuera de rango
    void validate() const;
};

// Lee el archivo y completa cfg; false si no se pudo abrir.
// Valores fuera de rango -> std::invalid_argument
bool load_pipeline_config(const std::string& path, PipelineConfig& cfg);

void apply_config(const SimpleToml& toml, PipelineConfig& cfg);
