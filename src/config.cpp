// ============= src/config.cpp =============
#include "config.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

// ==================== SimpleToml ====================

std::string SimpleToml::trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool SimpleToml::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

bool SimpleToml::parse(const std::string& content) {
    std::istringstream input(content);
    std::string line, section;

    while (std::getline(input, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        // Comentario al final de la línea (solo fuera de strings)
        bool in_string = false;
        for (size_t i = 0; i < val.size(); i++) {
            if (val[i] == '"') in_string = !in_string;
            if (val[i] == '#' && !in_string) {
                val = trim(val.substr(0, i));
                break;
            }
        }

        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.length() - 2);
        }

        std::string full_key = section.empty() ? key : section + "." + key;
        values[full_key] = val;
    }
    return true;
}

std::string SimpleToml::get(const std::string& key, const std::string& def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
}

int SimpleToml::get_int(const std::string& key, int def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;

    try {
        return std::stoi(it->second);
    } catch (const std::exception&) {
        spdlog::warn("⚠️  {} = '{}' no es un entero, usando {}", key, it->second, def);
        return def;
    }
}

float SimpleToml::get_float(const std::string& key, float def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;

    try {
        return std::stof(it->second);
    } catch (const std::exception&) {
        spdlog::warn("⚠️  {} = '{}' no es un número, usando {}", key, it->second, def);
        return def;
    }
}

bool SimpleToml::get_bool(const std::string& key, bool def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;

    const std::string& v = it->second;
    if (v == "true" || v == "1") return true;
    if (v == "false" || v == "0") return false;
    return def;
}

// ==================== PipelineConfig ====================

PipelineConfig::PipelineConfig() {
    tracker.min_iou = Config::DEFAULT_MIN_IOU;
    tracker.creation_confidence = Config::DEFAULT_CREATION_CONFIDENCE;
    tracker.min_hits = Config::DEFAULT_MIN_HITS;
    tracker.lost_grace_frames = Config::DEFAULT_LOST_GRACE_FRAMES;
    tracker.max_lost_frames = Config::DEFAULT_MAX_LOST_FRAMES;

    index.embedding_dim = Config::DEFAULT_EMBEDDING_DIM;
    index.accept_threshold = Config::DEFAULT_ACCEPT_THRESHOLD;
    index.backend = backend_from_string(Config::DEFAULT_BACKEND);

    engagement.yaw = Config::DEFAULT_YAW_THRESHOLD;
    engagement.pitch = Config::DEFAULT_PITCH_THRESHOLD;
    engagement.medium_factor = Config::DEFAULT_MEDIUM_FACTOR;
}

void PipelineConfig::validate() const {
    tracker.validate();
    index.validate();
    engagement.validate();

    if (embed_interval < 1) {
        throw std::invalid_argument("recognition.embed_interval must be >= 1");
    }
    if (pose_interval < 1) {
        throw std::invalid_argument("behavior.pose_interval must be >= 1");
    }
    if (external_timeout_ms < 0) {
        throw std::invalid_argument("pipeline.external_timeout_ms must be >= 0");
    }
    if (min_face_size < 0) {
        throw std::invalid_argument("models.min_face_size must be >= 0");
    }
    if (reconnect_retries < 1) {
        throw std::invalid_argument("input.reconnect_retries must be >= 1");
    }
}

void apply_config(const SimpleToml& toml, PipelineConfig& cfg) {
    // [tracker]
    cfg.tracker.min_iou = toml.get_float("tracker.min_iou", cfg.tracker.min_iou);
    cfg.tracker.creation_confidence =
        toml.get_float("tracker.creation_confidence", cfg.tracker.creation_confidence);
    cfg.tracker.min_hits = toml.get_int("tracker.min_hits", cfg.tracker.min_hits);
    cfg.tracker.lost_grace_frames =
        toml.get_int("tracker.lost_grace_frames", cfg.tracker.lost_grace_frames);
    cfg.tracker.max_lost_frames =
        toml.get_int("tracker.max_lost_frames", cfg.tracker.max_lost_frames);

    // [recognition]
    cfg.index.embedding_dim = toml.get_int("recognition.embedding_dim", cfg.index.embedding_dim);
    cfg.index.accept_threshold =
        toml.get_float("recognition.accept_threshold", cfg.index.accept_threshold);
    if (toml.has("recognition.backend")) {
        cfg.index.backend = backend_from_string(toml.get("recognition.backend"));
    }
    cfg.embed_interval = toml.get_int("recognition.embed_interval", cfg.embed_interval);

    // [behavior]
    cfg.pose_enabled = toml.get_bool("behavior.enabled", cfg.pose_enabled);
    cfg.engagement.yaw = toml.get_float("behavior.yaw_threshold", cfg.engagement.yaw);
    cfg.engagement.pitch = toml.get_float("behavior.pitch_threshold", cfg.engagement.pitch);
    cfg.engagement.medium_factor =
        toml.get_float("behavior.medium_factor", cfg.engagement.medium_factor);
    cfg.pose_interval = toml.get_int("behavior.pose_interval", cfg.pose_interval);

    // [pipeline]
    cfg.external_timeout_ms =
        toml.get_int("pipeline.external_timeout_ms", cfg.external_timeout_ms);

    // [database]
    cfg.db_path = toml.get("database.path", cfg.db_path);

    // [models]
    cfg.detector_model = toml.get("models.detector", cfg.detector_model);
    cfg.recognizer_model = toml.get("models.recognizer", cfg.recognizer_model);
    cfg.detector_conf_threshold =
        toml.get_float("models.conf_threshold", cfg.detector_conf_threshold);
    cfg.detector_nms_threshold =
        toml.get_float("models.nms_threshold", cfg.detector_nms_threshold);
    cfg.min_face_size = toml.get_int("models.min_face_size", cfg.min_face_size);

    // [logging]
    cfg.log_level = toml.get("logging.level", cfg.log_level);
    cfg.log_file = toml.get("logging.file", cfg.log_file);

    // [input]
    if (toml.has("input.sources")) {
        // Acepta "a, b" o ["a", "b"]
        std::string list = toml.get("input.sources");
        if (list.size() >= 2 && list.front() == '[' && list.back() == ']') {
            list = list.substr(1, list.length() - 2);
        }
        cfg.sources = split_list(list);
    }
    cfg.reconnect_retries = toml.get_int("input.reconnect_retries", cfg.reconnect_retries);
    cfg.display = toml.get_bool("input.display", cfg.display);
}

bool load_pipeline_config(const std::string& path, PipelineConfig& cfg) {
    SimpleToml toml;
    if (!toml.load(path)) {
        spdlog::error("No se pudo cargar {}", path);
        return false;
    }

    apply_config(toml, cfg);
    cfg.validate();
    return true;
}
