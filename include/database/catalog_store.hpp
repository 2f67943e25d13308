// ============= include/database/catalog_store.hpp =============
/*
 * Identity Catalog Store - SQLite Backend
 *
 * CARACTERÍSTICAS:
 * - Almacena embeddings de referencia por persona
 * - Múltiples referencias por persona
 * - Persistencia en SQLite
 *
 * TABLA: face_embedding
 * ├── embedding_id (INTEGER PRIMARY KEY)
 * ├── person_id (TEXT)
 * ├── embedding (BLOB) - floats crudos
 * └── created_at (TEXT)
 *
 * OPERACIONES:
 * - load_all(): todas las referencias agrupadas por persona (lanza si falla)
 * - add_reference(): registrar una referencia
 * - remove_person(): eliminar todas las referencias de una persona
 * - count_references(): total de filas
 */

#pragma once
#include "database/vector_index.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

class IdentityCatalogStore {
public:
    virtual ~IdentityCatalogStore() = default;

    virtual std::vector<IdentityRecord> load_all() = 0;
    virtual bool add_reference(const std::string& person_id,
                               const std::vector<float>& embedding) = 0;
    virtual int remove_person(const std::string& person_id) = 0;
    virtual int count_references() = 0;
};

class SqliteCatalogStore : public IdentityCatalogStore {
public:
    SqliteCatalogStore(const std::string& db_path, int embedding_size = 512);
    ~SqliteCatalogStore() override;

    SqliteCatalogStore(const SqliteCatalogStore&) = delete;
    SqliteCatalogStore& operator=(const SqliteCatalogStore&) = delete;

    std::vector<IdentityRecord> load_all() override;
    bool add_reference(const std::string& person_id,
                       const std::vector<float>& embedding) override;
    // Retorna el número de referencias eliminadas, -1 si falla
    int remove_person(const std::string& person_id) override;
    int count_references() override;

    bool is_open() const { return db != nullptr; }

private:
    sqlite3* db;
    std::string db_path;
    int embedding_size;

    bool init_database();
    bool create_tables();

    static std::vector<unsigned char> serialize_embedding(const std::vector<float>& emb);
    static std::vector<float> deserialize_embedding(const unsigned char* data, int size);
};
