#include <gtest/gtest.h>
#include <minirel/minirel.hpp>
#include <filesystem>
#include <fstream>

using namespace minirel;
namespace fs = std::filesystem;

class StorageEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "storage_engine_test";
        fs::remove_all(test_dir_);

        config_.data_directory = test_dir_;
        config_.page_size = 1024;
        config_.buffer_pool_size = 4;
        config_.btree_order = 4;

        open_engine();
    }

    void TearDown() override {
        engine_.reset();
        fs::remove_all(test_dir_);
    }

    void open_engine() {
        auto result = StorageEngine::open(config_);
        ASSERT_TRUE(result.ok()) << result.error().to_string();
        engine_ = std::move(result).value();
    }

    void reopen_engine() {
        engine_.reset();
        open_engine();
    }

    static Schema people() {
        return Schema({
            Column("id", ValueType::BIGINT),
            Column("name", ValueType::VARCHAR, 32),
            Column("age", ValueType::INT),
        });
    }

    static Row person(int64_t id, const std::string& name, int age) {
        return {Value::big_integer(id), Value::varchar(name), Value::integer(age)};
    }

    fs::path test_dir_;
    Config config_;
    std::unique_ptr<StorageEngine> engine_;
};

TEST_F(StorageEngineTest, OpenCreatesDirectory) {
    EXPECT_TRUE(engine_->is_open());
    EXPECT_TRUE(fs::is_directory(test_dir_));
}

TEST_F(StorageEngineTest, InvalidConfigIsRejected) {
    Config bad = config_;
    bad.page_size = 1000;
    EXPECT_EQ(StorageEngine::open(bad).error_code(), ErrorCode::INVALID_ARGUMENT);

    bad = config_;
    bad.buffer_pool_size = 0;
    EXPECT_EQ(StorageEngine::open(bad).error_code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(StorageEngineTest, CreateOpenDropTable) {
    auto created = engine_->create_table("people", people());
    ASSERT_TRUE(created.ok()) << created.error().to_string();
    EXPECT_TRUE(engine_->table_exists("people"));
    EXPECT_TRUE(fs::exists(engine_->table_path("people")));

    EXPECT_EQ(engine_->create_table("people", people()).error_code(), ErrorCode::ALREADY_EXISTS);

    auto opened = engine_->open_table("people", people());
    ASSERT_TRUE(opened.ok());
    EXPECT_EQ(opened.value(), created.value());

    ASSERT_TRUE(engine_->drop_table("people").ok());
    EXPECT_FALSE(engine_->table_exists("people"));
    EXPECT_EQ(engine_->open_table("people", people()).error_code(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(engine_->drop_table("people").error_code(), ErrorCode::NOT_FOUND);
}

TEST_F(StorageEngineTest, TableNamesAreChecked) {
    EXPECT_EQ(engine_->create_table("", people()).error_code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(engine_->create_table("a/b", people()).error_code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(engine_->create_table("__idx", people()).error_code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_TRUE(engine_->create_table("order_items_2", people()).ok());
}

TEST_F(StorageEngineTest, InsertUpdatesEveryIndex) {
    ASSERT_TRUE(engine_->create_table("people", people()).ok());
    ASSERT_TRUE(engine_->insert("people", person(1, "ann", 30)).ok());

    ASSERT_TRUE(engine_->create_index("people", "age").ok());
    ASSERT_TRUE(engine_->create_index("people", "name", "by_name").ok());

    // INT literal widened to the BIGINT column before indexing
    Row narrow = {Value::integer(2), Value::varchar("bob"), Value::integer(30)};
    ASSERT_TRUE(engine_->insert("people", narrow).ok());

    auto by_age = engine_->index("people", "idx_age");
    ASSERT_TRUE(by_age.ok());
    auto rows = by_age.value()->find(Value::integer(30));
    ASSERT_TRUE(rows.ok());
    ASSERT_EQ(rows.value().size(), 2u);
    EXPECT_EQ(rows.value()[0], person(1, "ann", 30));
    EXPECT_EQ(rows.value()[1], person(2, "bob", 30));

    auto by_name = engine_->index("people", "by_name");
    ASSERT_TRUE(by_name.ok());
    EXPECT_EQ(by_name.value()->find(Value::varchar("bob")).value().size(), 1u);

    auto meta = engine_->find_index_by_column("people", "name");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->name, "by_name");
    EXPECT_EQ(engine_->list_indexes("people").size(), 2u);
}

TEST_F(StorageEngineTest, RejectedRowReachesNoIndex) {
    ASSERT_TRUE(engine_->create_table("people", people()).ok());
    ASSERT_TRUE(engine_->create_index("people", "age").ok());

    auto result = engine_->insert("people", {Value::integer(1)});
    EXPECT_EQ(result.error_code(), ErrorCode::SCHEMA_MISMATCH);

    auto index = engine_->index("people", "idx_age");
    ASSERT_TRUE(index.ok());
    EXPECT_TRUE(index.value()->tree().empty());
}

TEST_F(StorageEngineTest, RowTooWideForIndexIsRejectedBeforeHeap) {
    Schema notes({
        Column("id", ValueType::INT),
        Column("body", ValueType::VARCHAR, 900),
    });
    auto table = engine_->create_table("notes", notes);
    ASSERT_TRUE(table.ok());
    ASSERT_TRUE(engine_->create_index("notes", "body").ok());

    // Fits a 1 KiB data page, but key plus row does not fit an index page
    Row wide = {Value::integer(1), Value::varchar(std::string(600, 'w'))};
    auto result = engine_->insert("notes", wide);
    EXPECT_EQ(result.error_code(), ErrorCode::INVALID_ARGUMENT);

    EXPECT_EQ(table.value()->row_count().value(), 0u);
    auto index = engine_->index("notes", "idx_body");
    ASSERT_TRUE(index.ok());
    EXPECT_TRUE(index.value()->tree().empty());

    ASSERT_TRUE(engine_->insert("notes", {Value::integer(2), Value::varchar("short")}).ok());
    EXPECT_EQ(table.value()->row_count().value(), 1u);
    EXPECT_EQ(index.value()->find(Value::varchar("short")).value().size(), 1u);
}

TEST_F(StorageEngineTest, IndexOverWideRowLeavesNoTrace) {
    Schema notes({
        Column("id", ValueType::INT),
        Column("body", ValueType::VARCHAR, 900),
    });
    ASSERT_TRUE(engine_->create_table("notes", notes).ok());
    ASSERT_TRUE(engine_->insert("notes", {Value::integer(1), Value::varchar(std::string(600, 'w'))}).ok());

    auto created = engine_->create_index("notes", "body");
    EXPECT_EQ(created.error_code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_TRUE(engine_->list_indexes("notes").empty());
    EXPECT_FALSE(fs::exists(test_dir_ / IndexRegistry::index_file_name("notes", "idx_body")));
}

TEST_F(StorageEngineTest, InsertIntoUnopenedTable) {
    EXPECT_EQ(engine_->insert("ghost", person(1, "x", 1)).error_code(), ErrorCode::NOT_FOUND);
}

TEST_F(StorageEngineTest, DropIndex) {
    ASSERT_TRUE(engine_->create_table("people", people()).ok());
    ASSERT_TRUE(engine_->create_index("people", "age").ok());

    ASSERT_TRUE(engine_->drop_index("people", "idx_age").ok());
    EXPECT_TRUE(engine_->list_indexes("people").empty());
    EXPECT_EQ(engine_->index("people", "idx_age").error_code(), ErrorCode::NOT_FOUND);

    // Inserts no longer touch the dropped index
    EXPECT_TRUE(engine_->insert("people", person(1, "ann", 30)).ok());
}

TEST_F(StorageEngineTest, DropTableDropsItsIndexes) {
    ASSERT_TRUE(engine_->create_table("people", people()).ok());
    ASSERT_TRUE(engine_->create_index("people", "age").ok());

    ASSERT_TRUE(engine_->drop_table("people").ok());
    EXPECT_TRUE(engine_->list_indexes("people").empty());
}

TEST_F(StorageEngineTest, TableStatsCountPoolTraffic) {
    auto table = engine_->create_table("people", people());
    ASSERT_TRUE(table.ok());
    for (int i = 0; i < 200; ++i) {
        ASSERT_TRUE(engine_->insert("people", person(i, "name" + std::to_string(i), i % 50)).ok());
    }

    auto before = engine_->table_stats("people");
    ASSERT_TRUE(before.ok());
    EXPECT_GT(table.value()->page_count(), 4u);
    EXPECT_GT(before.value().evictions, 0u);
    EXPECT_GT(before.value().pages_written, 0u);

    EXPECT_EQ(engine_->table_stats("ghost").error_code(), ErrorCode::NOT_FOUND);
}

TEST_F(StorageEngineTest, DataAndIndexesSurviveReopen) {
    ASSERT_TRUE(engine_->create_table("people", people()).ok());
    for (int i = 0; i < 60; ++i) {
        ASSERT_TRUE(engine_->insert("people", person(i, "p" + std::to_string(i), i % 6)).ok());
    }
    ASSERT_TRUE(engine_->create_index("people", "age").ok());
    ASSERT_TRUE(engine_->insert("people", person(60, "late", 2)).ok());
    ASSERT_TRUE(engine_->flush().ok());

    reopen_engine();

    EXPECT_TRUE(fs::exists(test_dir_ / StorageEngine::CATALOG_FILE));
    auto table = engine_->open_table("people", people());
    ASSERT_TRUE(table.ok());
    EXPECT_EQ(table.value()->row_count().value(), 61u);

    EXPECT_FALSE(engine_->indexes().is_loaded("people", "idx_age"));
    auto index = engine_->index("people", "idx_age");
    ASSERT_TRUE(index.ok());

    auto rows = index.value()->find(Value::integer(2));
    ASSERT_TRUE(rows.ok());
    ASSERT_EQ(rows.value().size(), 11u);
    EXPECT_EQ(rows.value().back(), person(60, "late", 2));
}

TEST_F(StorageEngineTest, CorruptCatalogFailsOpen) {
    engine_.reset();
    {
        std::ofstream out(test_dir_ / StorageEngine::CATALOG_FILE);
        out << "not json";
    }
    EXPECT_EQ(StorageEngine::open(config_).error_code(), ErrorCode::CORRUPTION);
}

TEST_F(StorageEngineTest, CloseRejectsFurtherCalls) {
    ASSERT_TRUE(engine_->create_table("people", people()).ok());
    ASSERT_TRUE(engine_->insert("people", person(1, "ann", 30)).ok());

    ASSERT_TRUE(engine_->close().ok());
    EXPECT_FALSE(engine_->is_open());

    EXPECT_EQ(engine_->close().error_code(), ErrorCode::ENGINE_NOT_OPEN);
    EXPECT_EQ(engine_->insert("people", person(2, "bob", 1)).error_code(),
              ErrorCode::ENGINE_NOT_OPEN);
    EXPECT_EQ(engine_->create_table("other", people()).error_code(), ErrorCode::ENGINE_NOT_OPEN);
    EXPECT_TRUE(engine_->list_indexes("people").empty());

    // Closing flushed the row
    reopen_engine();
    auto table = engine_->open_table("people", people());
    ASSERT_TRUE(table.ok());
    EXPECT_EQ(table.value()->row_count().value(), 1u);
}

TEST_F(StorageEngineTest, EvictionPolicyFromConfig) {
    engine_.reset();
    config_.eviction_policy = EvictionPolicy::CLOCK;
    config_.eviction_log = true;
    open_engine();

    auto table = engine_->create_table("people", people());
    ASSERT_TRUE(table.ok());
    BufferPool* pool = table.value()->buffer_pool();
    EXPECT_EQ(pool->policy(), EvictionPolicy::CLOCK);
    EXPECT_TRUE(pool->eviction_log_enabled());
    EXPECT_EQ(pool->get_pool_size(), 4u);
}
