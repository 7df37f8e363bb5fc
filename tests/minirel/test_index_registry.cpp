#include <gtest/gtest.h>
#include <minirel/index/index_registry.hpp>
#include <filesystem>

using namespace minirel;
namespace fs = std::filesystem;

class IndexRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "index_registry_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);

        config_.data_directory = test_dir_;
        config_.page_size = 1024;
        config_.buffer_pool_size = 8;
        config_.btree_order = 4;

        handles_ = std::make_unique<HandlePool>();
        auto catalog = JsonIndexCatalog::open(test_dir_ / "indexes.json");
        ASSERT_TRUE(catalog.ok());
        catalog_ = std::move(catalog).value();
        registry_ = std::make_unique<IndexRegistry>(*handles_, *catalog_, config_);

        table_path_ = test_dir_ / "t.tbl";
        auto handle = handles_->acquire(table_path_, config_.page_size, config_.buffer_pool_size);
        ASSERT_TRUE(handle.ok());
        heap_ = std::make_unique<TableHeap>("t", schema(), handle.value()->pool.get());

        ASSERT_TRUE(heap_->append(row("A", 1)).ok());
        ASSERT_TRUE(heap_->append(row("B", 3)).ok());
        ASSERT_TRUE(heap_->append(row("C", 3)).ok());
    }

    void TearDown() override {
        registry_.reset();
        heap_.reset();
        catalog_.reset();
        handles_.reset();
        fs::remove_all(test_dir_);
    }

    static Schema schema() {
        return Schema({Column("name", ValueType::VARCHAR, 16), Column("k", ValueType::INT)});
    }

    static Row row(const std::string& name, int k) {
        return {Value::varchar(name), Value::integer(k)};
    }

    fs::path index_path(const std::string& name) const {
        return test_dir_ / IndexRegistry::index_file_name("t", name);
    }

    fs::path test_dir_;
    fs::path table_path_;
    Config config_;
    std::unique_ptr<HandlePool> handles_;
    std::unique_ptr<JsonIndexCatalog> catalog_;
    std::unique_ptr<IndexRegistry> registry_;
    std::unique_ptr<TableHeap> heap_;
};

TEST_F(IndexRegistryTest, CreateIndexesExistingRows) {
    auto index = registry_->create("t", *heap_, "k", "idx_k");
    ASSERT_TRUE(index.ok()) << index.error().to_string();

    auto rows = index.value()->find(Value::integer(3));
    ASSERT_TRUE(rows.ok());
    ASSERT_EQ(rows.value().size(), 2u);
    EXPECT_EQ(rows.value()[0], row("B", 3));
    EXPECT_EQ(rows.value()[1], row("C", 3));

    EXPECT_TRUE(fs::exists(index_path("idx_k")));
    EXPECT_TRUE(catalog_->get("t", "idx_k").has_value());
    EXPECT_TRUE(registry_->is_loaded("t", "idx_k"));
}

TEST_F(IndexRegistryTest, DefaultNameFollowsColumn) {
    auto index = registry_->create("t", *heap_, "name", "");
    ASSERT_TRUE(index.ok());
    EXPECT_EQ(index.value()->meta().name, "idx_name");
    EXPECT_EQ(index.value()->meta().file, index_path("idx_name").string());
}

TEST_F(IndexRegistryTest, DuplicateNameIsRejected) {
    ASSERT_TRUE(registry_->create("t", *heap_, "k", "idx_k").ok());

    auto again = registry_->create("t", *heap_, "name", "idx_k");
    EXPECT_EQ(again.error_code(), ErrorCode::ALREADY_EXISTS);
    EXPECT_EQ(catalog_->list("t").size(), 1u);
}

TEST_F(IndexRegistryTest, UnknownColumnIsNotFound) {
    auto result = registry_->create("t", *heap_, "missing", "idx_missing");
    EXPECT_EQ(result.error_code(), ErrorCode::NOT_FOUND);
    EXPECT_FALSE(fs::exists(index_path("idx_missing")));
    EXPECT_TRUE(catalog_->list("t").empty());
}

TEST_F(IndexRegistryTest, DropKeepsFileButForgetsIndex) {
    ASSERT_TRUE(registry_->create("t", *heap_, "k", "idx_k").ok());

    ASSERT_TRUE(registry_->drop("t", "idx_k").ok());
    EXPECT_FALSE(registry_->is_loaded("t", "idx_k"));
    EXPECT_FALSE(catalog_->get("t", "idx_k").has_value());
    EXPECT_TRUE(fs::exists(index_path("idx_k")));
    EXPECT_FALSE(handles_->contains(index_path("idx_k")));

    EXPECT_EQ(registry_->load("t", "idx_k").error_code(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(registry_->drop("t", "idx_k").error_code(), ErrorCode::NOT_FOUND);
}

TEST_F(IndexRegistryTest, RecreateAfterDropStartsFresh) {
    ASSERT_TRUE(registry_->create("t", *heap_, "k", "idx_k").ok());
    ASSERT_TRUE(registry_->drop("t", "idx_k").ok());

    auto index = registry_->create("t", *heap_, "k", "idx_k");
    ASSERT_TRUE(index.ok()) << index.error().to_string();
    EXPECT_EQ(index.value()->tree().size(), 3u);
    EXPECT_EQ(index.value()->file().entry_count().value(), 3u);
}

TEST_F(IndexRegistryTest, UnloadThenLoadRebuildsFromFile) {
    auto created = registry_->create("t", *heap_, "k", "idx_k");
    ASSERT_TRUE(created.ok());
    ASSERT_TRUE(created.value()->insert(Value::integer(3), row("D", 3)).ok());

    ASSERT_TRUE(registry_->mark_unloaded("t", "idx_k").ok());
    EXPECT_FALSE(registry_->is_loaded("t", "idx_k"));
    EXPECT_FALSE(handles_->contains(index_path("idx_k")));

    auto loaded = registry_->load("t", "idx_k");
    ASSERT_TRUE(loaded.ok());
    EXPECT_TRUE(registry_->is_loaded("t", "idx_k"));

    auto rows = loaded.value()->find(Value::integer(3));
    ASSERT_TRUE(rows.ok());
    ASSERT_EQ(rows.value().size(), 3u);
    EXPECT_EQ(rows.value()[2], row("D", 3));

    // A second load returns the cached instance
    EXPECT_EQ(registry_->load("t", "idx_k").value(), loaded.value());
}

TEST_F(IndexRegistryTest, LoadSurvivesNewRegistry) {
    ASSERT_TRUE(registry_->create("t", *heap_, "k", "idx_k").ok());
    registry_.reset();

    auto catalog = JsonIndexCatalog::open(test_dir_ / "indexes.json");
    ASSERT_TRUE(catalog.ok());
    catalog_ = std::move(catalog).value();
    registry_ = std::make_unique<IndexRegistry>(*handles_, *catalog_, config_);

    EXPECT_FALSE(registry_->is_loaded("t", "idx_k"));
    auto index = registry_->load("t", "idx_k");
    ASSERT_TRUE(index.ok());

    auto rows = index.value()->range_rows(Value::integer(0), Value::integer(2));
    ASSERT_TRUE(rows.ok());
    ASSERT_EQ(rows.value().size(), 1u);
    EXPECT_EQ(rows.value()[0], row("A", 1));
}

TEST_F(IndexRegistryTest, FindByColumnAndList) {
    ASSERT_TRUE(registry_->create("t", *heap_, "k", "idx_k").ok());
    ASSERT_TRUE(registry_->create("t", *heap_, "name", "").ok());

    auto meta = registry_->find_by_column("t", "name");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->name, "idx_name");
    EXPECT_FALSE(registry_->find_by_column("t", "other").has_value());
    EXPECT_FALSE(registry_->find_by_column("u", "k").has_value());

    std::vector<IndexMeta> all = registry_->list("t");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].name, "idx_k");
    EXPECT_EQ(all[1].name, "idx_name");
}

TEST_F(IndexRegistryTest, DropAllForgetsEveryIndexOfTable) {
    ASSERT_TRUE(registry_->create("t", *heap_, "k", "idx_k").ok());
    ASSERT_TRUE(registry_->create("t", *heap_, "name", "").ok());

    ASSERT_TRUE(registry_->drop_all("t").ok());
    EXPECT_TRUE(registry_->list("t").empty());
    EXPECT_FALSE(registry_->is_loaded("t", "idx_name"));

    // Only the table's own handle remains open
    EXPECT_EQ(handles_->size(), 1u);
}

TEST_F(IndexRegistryTest, IndexFileName) {
    EXPECT_EQ(IndexRegistry::index_file_name("people", "idx_age"), "__idx__people__idx_age.idx");
}
