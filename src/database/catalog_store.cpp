// ============= src/database/catalog_store.cpp =============
#include "database/catalog_store.hpp"
#include <spdlog/spdlog.h>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <map>
#include <stdexcept>

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

SqliteCatalogStore::SqliteCatalogStore(const std::string& db_path, int embedding_size)
    : db(nullptr), db_path(db_path), embedding_size(embedding_size)
{
    spdlog::info("🗄️  Opening identity catalog");
    spdlog::info("   Path: {}", db_path);
    spdlog::info("   Embedding size: {}", embedding_size);

    if (embedding_size <= 0) {
        throw std::invalid_argument("embedding_size must be positive");
    }

    // Crear directorio si no existe
    if (db_path != ":memory:") {
        std::filesystem::path p(db_path);
        if (!p.parent_path().empty()) {
            std::filesystem::create_directories(p.parent_path());
        }
    }

    if (!init_database()) {
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
        throw std::runtime_error("Could not open identity catalog: " + db_path);
    }

    spdlog::info("✓ Catalog ready ({} references)", count_references());
}

SqliteCatalogStore::~SqliteCatalogStore() {
    if (db) {
        sqlite3_close(db);
    }
}

// ==================== INITIALIZATION ====================

bool SqliteCatalogStore::init_database() {
    int rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        spdlog::error("Cannot open database: {}", db ? sqlite3_errmsg(db) : "out of memory");
        return false;
    }

    return create_tables();
}

bool SqliteCatalogStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS face_embedding (
            embedding_id INTEGER PRIMARY KEY AUTOINCREMENT,
            person_id TEXT NOT NULL,
            embedding BLOB NOT NULL,
            created_at TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_face_embedding_person ON face_embedding(person_id);
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        spdlog::error("SQL error: {}", err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        return false;
    }

    return true;
}

// ==================== SERIALIZATION ====================

std::vector<unsigned char> SqliteCatalogStore::serialize_embedding(const std::vector<float>& emb) {
    std::vector<unsigned char> blob(emb.size() * sizeof(float));
    std::memcpy(blob.data(), emb.data(), blob.size());
    return blob;
}

std::vector<float> SqliteCatalogStore::deserialize_embedding(const unsigned char* data, int size) {
    std::vector<float> emb(size / sizeof(float));
    if (data && !emb.empty()) {
        std::memcpy(emb.data(), data, emb.size() * sizeof(float));
    }
    return emb;
}

// ==================== LOAD ====================

std::vector<IdentityRecord> SqliteCatalogStore::load_all() {
    const char* sql =
        "SELECT person_id, embedding FROM face_embedding ORDER BY embedding_id";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to prepare catalog query: ") +
                                 sqlite3_errmsg(db));
    }

    std::vector<IdentityRecord> records;
    std::map<std::string, size_t> position;   // person_id -> índice en records
    int skipped = 0;

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const char* person = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        const unsigned char* blob = static_cast<const unsigned char*>(sqlite3_column_blob(stmt, 1));
        int blob_size = sqlite3_column_bytes(stmt, 1);

        if (!person || blob_size != embedding_size * static_cast<int>(sizeof(float))) {
            skipped++;
            continue;
        }

        auto it = position.find(person);
        if (it == position.end()) {
            it = position.emplace(person, records.size()).first;
            records.push_back(IdentityRecord{person, {}});
        }
        records[it->second].references.push_back(deserialize_embedding(blob, blob_size));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to read catalog: ") + sqlite3_errmsg(db));
    }

    if (skipped > 0) {
        spdlog::warn("⚠️  Skipped {} malformed catalog rows", skipped);
    }

    return records;
}

// ==================== ADD ====================

bool SqliteCatalogStore::add_reference(const std::string& person_id,
                                       const std::vector<float>& embedding)
{
    if (person_id.empty()) {
        spdlog::error("Empty person_id");
        return false;
    }

    if (embedding.size() != static_cast<size_t>(embedding_size)) {
        spdlog::error("Invalid embedding size: {} (expected {})",
                      embedding.size(), embedding_size);
        return false;
    }

    std::time_t now = std::time(nullptr);
    char timestamp[32];
    std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S",
                  std::localtime(&now));

    auto blob = serialize_embedding(embedding);

    const char* sql =
        "INSERT INTO face_embedding (person_id, embedding, created_at) VALUES (?, ?, ?)";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db));
        return false;
    }

    sqlite3_bind_text(stmt, 1, person_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, timestamp, -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        spdlog::error("Failed to insert: {}", sqlite3_errmsg(db));
        return false;
    }

    spdlog::info("✓ Added reference for '{}' (row {})",
                 person_id, sqlite3_last_insert_rowid(db));
    return true;
}

// ==================== REMOVE ====================

int SqliteCatalogStore::remove_person(const std::string& person_id) {
    const char* sql = "DELETE FROM face_embedding WHERE person_id = ?";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db));
        return -1;
    }

    sqlite3_bind_text(stmt, 1, person_id.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        spdlog::error("Failed to delete: {}", sqlite3_errmsg(db));
        return -1;
    }

    int removed = sqlite3_changes(db);
    spdlog::info("✓ Removed '{}' ({} references)", person_id, removed);
    return removed;
}

int SqliteCatalogStore::count_references() {
    const char* sql = "SELECT COUNT(*) FROM face_embedding";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return 0;

    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count;
}
