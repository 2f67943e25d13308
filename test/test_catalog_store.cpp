// ============= test/test_catalog_store.cpp =============
#include "database/catalog_store.hpp"
#include "database/similarity_index.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <unistd.h>

namespace {

constexpr int DIM = 8;

class CatalogStoreTest : public ::testing::Test {
protected:
    std::filesystem::path dir;
    std::string db_path;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() /
              ("facepass_catalog_" + std::to_string(getpid()) + "_" + info->name());
        std::filesystem::remove_all(dir);
        // Subdirectorio inexistente: el store lo crea
        db_path = (dir / "nested" / "catalog.db").string();
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }
};

}  // namespace

TEST_F(CatalogStoreTest, CreatesDatabaseAndDirectory) {
    SqliteCatalogStore store(db_path, DIM);

    EXPECT_TRUE(store.is_open());
    EXPECT_TRUE(std::filesystem::exists(db_path));
    EXPECT_EQ(store.count_references(), 0);
    EXPECT_TRUE(store.load_all().empty());
}

TEST_F(CatalogStoreTest, GroupsReferencesByPersonInInsertionOrder) {
    SqliteCatalogStore store(db_path, DIM);

    ASSERT_TRUE(store.add_reference("bob", unit_vector(DIM, 1)));
    ASSERT_TRUE(store.add_reference("alice", unit_vector(DIM, 0)));
    ASSERT_TRUE(store.add_reference("bob", unit_vector(DIM, 2, 0.5f)));

    std::vector<IdentityRecord> records = store.load_all();
    ASSERT_EQ(records.size(), 2u);

    EXPECT_EQ(records[0].person_id, "bob");
    ASSERT_EQ(records[0].references.size(), 2u);
    EXPECT_EQ(records[0].references[0], unit_vector(DIM, 1));
    EXPECT_EQ(records[0].references[1], unit_vector(DIM, 2, 0.5f));

    EXPECT_EQ(records[1].person_id, "alice");
    ASSERT_EQ(records[1].references.size(), 1u);

    EXPECT_EQ(store.count_references(), 3);
}

TEST_F(CatalogStoreTest, RejectsInvalidReferences) {
    SqliteCatalogStore store(db_path, DIM);

    EXPECT_FALSE(store.add_reference("", unit_vector(DIM, 0)));
    EXPECT_FALSE(store.add_reference("alice", unit_vector(DIM + 1, 0)));
    EXPECT_EQ(store.count_references(), 0);
}

TEST_F(CatalogStoreTest, RemovePersonReturnsDeletedCount) {
    SqliteCatalogStore store(db_path, DIM);
    store.add_reference("alice", unit_vector(DIM, 0));
    store.add_reference("alice", unit_vector(DIM, 1));
    store.add_reference("bob", unit_vector(DIM, 2));

    EXPECT_EQ(store.remove_person("alice"), 2);
    EXPECT_EQ(store.remove_person("alice"), 0);
    EXPECT_EQ(store.count_references(), 1);

    std::vector<IdentityRecord> records = store.load_all();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].person_id, "bob");
}

TEST_F(CatalogStoreTest, PersistsAcrossReopen) {
    {
        SqliteCatalogStore store(db_path, DIM);
        store.add_reference("alice", unit_vector(DIM, 3));
    }

    SqliteCatalogStore reopened(db_path, DIM);
    std::vector<IdentityRecord> records = reopened.load_all();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].references[0], unit_vector(DIM, 3));
}

TEST_F(CatalogStoreTest, SkipsRowsOfAnotherDimension) {
    {
        SqliteCatalogStore wide(db_path, DIM * 2);
        wide.add_reference("legacy", unit_vector(DIM * 2, 0));
    }

    SqliteCatalogStore store(db_path, DIM);
    store.add_reference("alice", unit_vector(DIM, 0));

    std::vector<IdentityRecord> records = store.load_all();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].person_id, "alice");
}

TEST_F(CatalogStoreTest, FeedsSimilarityIndex) {
    SqliteCatalogStore store(db_path, DIM);
    store.add_reference("alice", unit_vector(DIM, 0));
    store.add_reference("bob", unit_vector(DIM, 1));

    IndexConfig config;
    config.embedding_dim = DIM;
    SimilarityIndex index(config);

    ASSERT_TRUE(index.reload(store));
    EXPECT_EQ(index.person_count(), 2u);

    auto match = index.query(unit_vector(DIM, 1));
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->person_id, "bob");
}

TEST(SqliteCatalogStore, InMemoryDatabase) {
    SqliteCatalogStore store(":memory:", DIM);
    EXPECT_TRUE(store.add_reference("alice", unit_vector(DIM, 0)));
    EXPECT_EQ(store.load_all().size(), 1u);
}

TEST(SqliteCatalogStore, RejectsNonPositiveEmbeddingSize) {
    EXPECT_THROW(SqliteCatalogStore(":memory:", 0), std::invalid_argument);
}
