// ============= tools/catalog_admin.cpp =============
/*
 * Herramienta de administración del catálogo de identidades (SQLite)
 *
 * EJEMPLOS DE USO:
 *
 *   ./build/bin/facepass_catalog list
 *   ./build/bin/facepass_catalog enroll alice fotos/alice_01.jpg
 *   ./build/bin/facepass_catalog remove alice
 *   ./build/bin/facepass_catalog search fotos/desconocido.jpg
 *   ./build/bin/facepass_catalog --config otra.toml list
 *
 * Usa database.path, models.* y recognition.* del config.
 */

#include "config.hpp"
#include "database/catalog_store.hpp"
#include "database/similarity_index.hpp"
#include "detection/yunet_detector.hpp"
#include "logging.hpp"
#include "recognition/sface_embedder.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class CatalogAdminTool {
private:
    PipelineConfig cfg;
    SqliteCatalogStore store;

    std::unique_ptr<YuNetDetector> detector;
    std::unique_ptr<SFaceEmbedder> embedder;

    // Los modelos solo se cargan para enroll/search
    void load_models() {
        if (detector) return;
        detector = std::make_unique<YuNetDetector>(
            cfg.detector_model, cfg.detector_conf_threshold,
            cfg.detector_nms_threshold, cfg.min_face_size);
        embedder = std::make_unique<SFaceEmbedder>(cfg.recognizer_model);

        if (embedder->get_embedding_size() != cfg.index.embedding_dim) {
            throw std::runtime_error("recognizer produces " +
                                     std::to_string(embedder->get_embedding_size()) +
                                     "D embeddings, catalog expects " +
                                     std::to_string(cfg.index.embedding_dim) + "D");
        }
    }

    // Embedding del rostro más grande de la imagen
    std::optional<std::vector<float>> embed_image(const std::string& image_path) {
        load_models();

        cv::Mat image = cv::imread(image_path);
        if (image.empty()) {
            spdlog::error("❌ No se pudo leer {}", image_path);
            return std::nullopt;
        }

        std::vector<Detection> faces = detector->detect(image);
        if (faces.empty()) {
            spdlog::error("❌ Sin rostros en {}", image_path);
            return std::nullopt;
        }

        auto largest = std::max_element(faces.begin(), faces.end(),
            [](const Detection& a, const Detection& b) {
                return a.box.area() < b.box.area();
            });

        if (faces.size() > 1) {
            spdlog::warn("⚠️  {} rostros en {}, usando el más grande", faces.size(), image_path);
        }
        if (!largest->quality_ok) {
            spdlog::warn("⚠️  Rostro menor a {}px, la referencia puede ser pobre",
                         cfg.min_face_size);
        }

        std::vector<float> embedding = embedder->embed(image, largest->box);
        if (!EmbeddingExtractor::l2_normalize(embedding)) {
            spdlog::error("❌ Embedding inválido para {}", image_path);
            return std::nullopt;
        }
        return embedding;
    }

public:
    explicit CatalogAdminTool(const PipelineConfig& config)
        : cfg(config), store(config.db_path, config.index.embedding_dim) {}

    int list() {
        std::vector<IdentityRecord> records = store.load_all();

        std::cout << "\n═══════════════════════════════════════════════" << std::endl;
        std::cout << "   CATÁLOGO: " << cfg.db_path << std::endl;
        std::cout << "═══════════════════════════════════════════════" << std::endl;

        if (records.empty()) {
            std::cout << "(vacío)" << std::endl;
            return 0;
        }

        std::cout << std::left << std::setw(30) << "PERSONA" << "REFERENCIAS" << std::endl;
        std::cout << "───────────────────────────────────────────────" << std::endl;
        for (const auto& record : records) {
            std::cout << std::left << std::setw(30) << record.person_id
                      << record.references.size() << std::endl;
        }
        std::cout << "───────────────────────────────────────────────" << std::endl;
        std::cout << "Total: " << records.size() << " personas, "
                  << store.count_references() << " referencias" << std::endl;
        return 0;
    }

    int enroll(const std::string& person_id, const std::string& image_path) {
        auto embedding = embed_image(image_path);
        if (!embedding) return 1;

        if (!store.add_reference(person_id, *embedding)) {
            spdlog::error("❌ No se pudo guardar la referencia de {}", person_id);
            return 1;
        }

        spdlog::info("💾 Referencia registrada: {} ({}D)", person_id, embedding->size());
        return 0;
    }

    int remove(const std::string& person_id) {
        int removed = store.remove_person(person_id);
        if (removed < 0) {
            spdlog::error("❌ Error eliminando {}", person_id);
            return 1;
        }
        if (removed == 0) {
            spdlog::warn("⚠️  {} no está en el catálogo", person_id);
            return 1;
        }

        spdlog::info("🗑️  {}: {} referencias eliminadas", person_id, removed);
        return 0;
    }

    int search(const std::string& image_path) {
        auto embedding = embed_image(image_path);
        if (!embedding) return 1;

        SimilarityIndex index(cfg.index);
        if (!index.reload(store)) {
            spdlog::error("❌ No se pudo cargar el catálogo");
            return 1;
        }

        auto best = index.nearest(*embedding);
        if (!best) {
            std::cout << "Sin candidatos (catálogo vacío)" << std::endl;
            return 0;
        }

        bool accepted = best->similarity >= cfg.index.accept_threshold;
        std::cout << "Candidato: " << best->person_id
                  << " | similarity=" << std::fixed << std::setprecision(3) << best->similarity
                  << " | umbral=" << cfg.index.accept_threshold
                  << " -> " << (accepted ? "MATCH" : "unknown") << std::endl;
        return 0;
    }
};

static void print_usage(const char* program) {
    std::cout << "Uso: " << program << " [--config config.toml] <comando>\n"
              << "  list                        Personas y número de referencias\n"
              << "  enroll <person_id> <imagen> Registrar el rostro más grande\n"
              << "  remove <person_id>          Eliminar todas las referencias\n"
              << "  search <imagen>             Identidad más cercana\n";
}

int main(int argc, char* argv[]) {
    std::string config_file = "config.toml";
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    PipelineConfig cfg;
    try {
        if (!load_pipeline_config(config_file, cfg)) {
            spdlog::warn("⚠️  Usando valores por defecto");
        }
    } catch (const std::exception& e) {
        spdlog::error("Config inválida en {}: {}", config_file, e.what());
        return 1;
    }

    // Solo consola: la herramienta no escribe en el log del runner
    setup_logging(cfg.log_level);

    const std::string& command = args[0];

    try {
        CatalogAdminTool tool(cfg);

        if (command == "list" && args.size() == 1) {
            return tool.list();
        }
        if (command == "enroll" && args.size() == 3) {
            return tool.enroll(args[1], args[2]);
        }
        if (command == "remove" && args.size() == 2) {
            return tool.remove(args[1]);
        }
        if (command == "search" && args.size() == 2) {
            return tool.search(args[1]);
        }
    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }

    print_usage(argv[0]);
    return 1;
}
