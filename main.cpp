// ============= main.cpp - FacePass runner (un StreamWorker por fuente) =============
#include "behavior/landmark_pose_estimator.hpp"
#include "config.hpp"
#include "database/catalog_store.hpp"
#include "database/similarity_index.hpp"
#include "detection/yunet_detector.hpp"
#include "draw_utils.hpp"
#include "logging.hpp"
#include "pipeline/stream_worker.hpp"
#include "recognition/sface_embedder.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

std::atomic<bool> stop_signal(false);

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        spdlog::info("Deteniendo");
        stop_signal = true;
    }
}

// Estado por fuente: captura + worker + último resultado para display
struct SourceContext {
    std::string source;
    std::unique_ptr<StreamWorker> worker;
    std::thread reader;
    std::atomic<bool> finished{false};

    std::mutex display_mutex;
    cv::Mat last_frame;
    FrameResult last_result;
    bool has_result = false;

    // Solo se toca desde el callback (hilo del worker, secuencial)
    std::map<int, std::string> last_labels;
};

static std::string identity_label(const TrackResult& track) {
    if (!track.identity) return "pending";
    if (!track.identity->person_id) return "unknown";
    return *track.identity->person_id;
}

static std::unique_ptr<FacePipeline> build_pipeline(const PipelineConfig& cfg,
                                                    std::shared_ptr<const SimilarityIndex> index,
                                                    const std::string& stream_id) {
    auto detector = std::make_shared<YuNetDetector>(
        cfg.detector_model, cfg.detector_conf_threshold,
        cfg.detector_nms_threshold, cfg.min_face_size);

    auto embedder = std::make_shared<SFaceEmbedder>(cfg.recognizer_model);
    if (embedder->get_embedding_size() != cfg.index.embedding_dim) {
        throw std::runtime_error("recognizer produces " +
                                 std::to_string(embedder->get_embedding_size()) +
                                 "D embeddings, index expects " +
                                 std::to_string(cfg.index.embedding_dim) + "D");
    }

    std::shared_ptr<PoseEstimator> pose;
    if (cfg.pose_enabled) {
        // Landmarks sobre el recorte: sin filtro de tamaño
        pose = std::make_shared<LandmarkPoseEstimator>(std::make_unique<YuNetDetector>(
            cfg.detector_model, cfg.detector_conf_threshold, cfg.detector_nms_threshold, 0));
    }

    return std::make_unique<FacePipeline>(cfg, detector, embedder, pose, index, stream_id);
}

static void reader_loop(SourceContext& ctx, const PipelineConfig& cfg) {
    const std::string& stream_id = ctx.worker->get_stream_id();
    bool live = is_camera_index(ctx.source) || ctx.source.rfind("rtsp://", 0) == 0;

    cv::VideoCapture cap;
    try {
        cap = open_cap(ctx.source, cfg.reconnect_retries);
    } catch (const std::exception& e) {
        spdlog::error("[stream={}] ❌ {}", stream_id, e.what());
        ctx.finished = true;
        return;
    }

    auto on_result = [&ctx, stream_id](const cv::Mat& frame) {
        return [&ctx, stream_id, frame](const FrameResult& result) {
            if (result.status != FrameStatus::Processed) return;

            for (const auto& track : result.tracks) {
                std::string label = identity_label(track);
                auto it = ctx.last_labels.find(track.track_id);
                if (it == ctx.last_labels.end() || it->second != label) {
                    ctx.last_labels[track.track_id] = label;
                    spdlog::info("[stream={}] 👤 Track {} -> {} (score={:.2f}, engagement={})",
                                 stream_id, track.track_id, label,
                                 track.identity ? track.identity->score : 0.0f,
                                 to_string(track.engagement));
                }
            }

            std::lock_guard<std::mutex> lock(ctx.display_mutex);
            ctx.last_frame = frame;
            ctx.last_result = result;
            ctx.has_result = true;
        };
    };

    while (!stop_signal) {
        // Mat nuevo por iteración: el worker conserva el anterior
        cv::Mat frame;
        if (!cap.read(frame) || frame.empty()) {
            if (!live) {
                spdlog::info("[stream={}] Fin del video", stream_id);
                break;
            }

            spdlog::warn("[stream={}] ⚠️  Frame perdido, reconectando...", stream_id);
            cap.release();
            std::this_thread::sleep_for(std::chrono::seconds(Config::RETRY_DELAY_SEC));
            try {
                cap = open_cap(ctx.source, cfg.reconnect_retries);
            } catch (const std::exception& e) {
                spdlog::error("[stream={}] ❌ {}", stream_id, e.what());
                break;
            }
            continue;
        }

        try {
            if (ctx.worker->submit(frame, on_result(frame)) == SubmitStatus::Rejected) {
                break;
            }
        } catch (const std::logic_error& e) {
            spdlog::critical("[stream={}] 💥 Worker detenido: {}", stream_id, e.what());
            break;
        }

        if (!live) {
            // Archivo: no adelantarse al worker para no descartar todo el video
            try {
                ctx.worker->wait_idle();
            } catch (const std::logic_error& e) {
                spdlog::critical("[stream={}] 💥 Worker detenido: {}", stream_id, e.what());
                break;
            }
        }
    }

    ctx.finished = true;
}

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::string config_file = argc >= 2 ? argv[1] : "config.toml";

    PipelineConfig cfg;
    try {
        if (!load_pipeline_config(config_file, cfg)) {
            spdlog::error("No se pudo cargar {}", config_file);
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("Config inválida en {}: {}", config_file, e.what());
        return 1;
    }

    setup_logging(cfg.log_level, cfg.log_file);

    if (cfg.sources.empty()) {
        spdlog::error("Sin fuentes: define input.sources en {}", config_file);
        return 1;
    }

    spdlog::info("═══════════════════════════════════════");
    spdlog::info("  FacePass");
    spdlog::info("  Fuentes: {}", cfg.sources.size());
    spdlog::info("  Backend: {} | Umbral: {:.2f} | Embed cada {} frames",
                 to_string(cfg.index.backend), cfg.index.accept_threshold, cfg.embed_interval);
    spdlog::info("═══════════════════════════════════════");

    // Catálogo compartido por todos los streams
    auto index = std::make_shared<SimilarityIndex>(cfg.index);
    try {
        SqliteCatalogStore store(cfg.db_path, cfg.index.embedding_dim);
        if (!index->reload(store)) {
            spdlog::warn("⚠️  Catálogo no disponible, todas las identidades serán unknown");
        }
    } catch (const std::exception& e) {
        spdlog::warn("⚠️  No se pudo abrir {}: {}", cfg.db_path, e.what());
    }
    spdlog::info("📚 Catálogo: {} personas, {} referencias",
                 index->person_count(), index->reference_count());

    std::vector<std::unique_ptr<SourceContext>> contexts;
    try {
        for (size_t i = 0; i < cfg.sources.size(); i++) {
            auto ctx = std::make_unique<SourceContext>();
            ctx->source = cfg.sources[i];
            std::string stream_id = "cam" + std::to_string(i);
            ctx->worker = std::make_unique<StreamWorker>(build_pipeline(cfg, index, stream_id));
            spdlog::info("🎥 {} -> {}", stream_id, ctx->source);
            contexts.push_back(std::move(ctx));
        }
    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }

    for (auto& ctx : contexts) {
        ctx->worker->start();
        SourceContext* raw = ctx.get();
        ctx->reader = std::thread([raw, &cfg] { reader_loop(*raw, cfg); });
    }

    DrawUtils::DrawConfig draw_config;

    // highgui solo en el hilo principal
    while (!stop_signal) {
        bool all_finished = true;
        for (auto& ctx : contexts) {
            if (!ctx->finished) all_finished = false;
        }
        if (all_finished) break;

        if (!cfg.display) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        for (auto& ctx : contexts) {
            cv::Mat display;
            FrameResult result;
            {
                std::lock_guard<std::mutex> lock(ctx->display_mutex);
                if (!ctx->has_result) continue;
                display = ctx->last_frame.clone();
                result = ctx->last_result;
            }
            DrawUtils::draw_tracks(display, result, draw_config);
            DrawUtils::draw_timings(display, result, draw_config);
            cv::imshow(ctx->worker->get_stream_id(), display);
        }

        int key = cv::waitKey(1);
        if (key == 'q' || key == 27) {
            stop_signal = true;
        }
    }

    stop_signal = true;
    for (auto& ctx : contexts) {
        if (ctx->reader.joinable()) ctx->reader.join();
        ctx->worker->stop();

        WorkerStats ws = ctx->worker->get_stats();
        PipelineStats ps = ctx->worker->get_pipeline().get_stats();
        spdlog::info("📊 [{}] frames={} skipped={} cancelled={} rejected={} | "
                     "embeds={} ({} fallidos) matches={} | tracks creados={}",
                     ctx->worker->get_stream_id(), ws.processed, ws.skipped,
                     ws.cancelled, ws.rejected, ps.embed_calls, ps.embed_failures,
                     ps.identities_matched,
                     ctx->worker->get_pipeline().get_tracker().get_total_tracks());
    }

    if (cfg.display) {
        cv::destroyAllWindows();
    }

    spdlog::info("Finalizado");
    return 0;
}
