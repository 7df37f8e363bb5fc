#include <gtest/gtest.h>
#include <minirel/index/btree_index.hpp>
#include <minirel/index/index_file.hpp>
#include <minirel/storage/handle_pool.hpp>
#include <algorithm>
#include <filesystem>
#include <optional>
#include <random>
#include <vector>

using namespace minirel;
namespace fs = std::filesystem;

class BTreeIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "btree_index_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);

        handles_ = std::make_unique<HandlePool>();
        path_ = test_dir_ / "__idx__people__idx_age.idx";

        meta_.table = "people";
        meta_.name = "idx_age";
        meta_.column = "age";
        meta_.file = path_.string();
    }

    void TearDown() override {
        handles_.reset();
        fs::remove_all(test_dir_);
    }

    FileHandle* acquire(size_t page_size = 1024) {
        auto handle = handles_->acquire(path_, page_size, 8);
        EXPECT_TRUE(handle.ok()) << handle.error().to_string();
        return handle.value();
    }

    static Row person(const std::string& name, int age) {
        return {Value::varchar(name), Value::integer(age)};
    }

    fs::path test_dir_;
    fs::path path_;
    IndexMeta meta_;
    std::unique_ptr<HandlePool> handles_;
};

TEST_F(BTreeIndexTest, EntryEncodingRejectsTrailingBytes) {
    std::string bytes = encode_index_entry(Value::integer(3), person("a", 3));
    auto decoded = decode_index_entry(bytes);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value().key, Value::integer(3));
    EXPECT_EQ(decoded.value().row, person("a", 3));

    EXPECT_EQ(decode_index_entry(bytes + "x").error_code(), ErrorCode::PAGE_FORMAT_ERROR);
    EXPECT_EQ(decode_index_entry(bytes.substr(0, bytes.size() - 1)).error_code(),
              ErrorCode::PAGE_FORMAT_ERROR);
}

TEST_F(BTreeIndexTest, IndexFileReplaysInWriteOrder) {
    FileHandle* handle = acquire();
    IndexFile file(handle->pool.get());

    // Enough entries to need several 1 KiB pages
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(file.append(Value::integer(i % 7), person("p" + std::to_string(i), i)).ok());
    }
    EXPECT_GT(file.page_count(), 1u);
    EXPECT_EQ(file.entry_count().value(), 100u);

    auto all = file.read_all();
    ASSERT_TRUE(all.ok());
    ASSERT_EQ(all.value().size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(all.value()[i].key, Value::integer(i % 7));
        EXPECT_EQ(all.value()[i].row[1], Value::integer(i));
    }
}

TEST_F(BTreeIndexTest, OversizedEntryIsInvalid) {
    FileHandle* handle = acquire(512);
    IndexFile file(handle->pool.get());

    auto result = file.append(Value::varchar(std::string(600, 'k')), {});
    EXPECT_EQ(result.error_code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(file.page_count(), 0u);
}

TEST_F(BTreeIndexTest, FirstLookupBuildsTree) {
    FileHandle* handle = acquire();
    {
        IndexFile file(handle->pool.get());
        ASSERT_TRUE(file.append(Value::integer(30), person("ann", 30)).ok());
        ASSERT_TRUE(file.append(Value::integer(25), person("bob", 25)).ok());
        ASSERT_TRUE(file.append(Value::integer(30), person("cid", 30)).ok());
    }

    BTreeIndex index(meta_, handle, 4);
    EXPECT_FALSE(index.is_built());

    auto rows = index.find(Value::integer(30));
    ASSERT_TRUE(rows.ok());
    EXPECT_TRUE(index.is_built());
    ASSERT_EQ(rows.value().size(), 2u);
    EXPECT_EQ(rows.value()[0], person("ann", 30));
    EXPECT_EQ(rows.value()[1], person("cid", 30));
    EXPECT_EQ(index.tree().size(), 3u);
}

TEST_F(BTreeIndexTest, InsertPersistsAcrossReopen) {
    {
        BTreeIndex index(meta_, acquire(), 4);
        for (int i = 0; i < 50; ++i) {
            ASSERT_TRUE(index.insert(Value::integer(i % 10), person("n" + std::to_string(i), i)).ok());
        }
        ASSERT_TRUE(index.flush().ok());
        EXPECT_EQ(index.tree().size(), 50u);
    }
    ASSERT_TRUE(handles_->release(path_).ok());
    EXPECT_FALSE(handles_->contains(path_));

    BTreeIndex reopened(meta_, acquire(), 4);
    auto rows = reopened.find(Value::integer(3));
    ASSERT_TRUE(rows.ok());
    ASSERT_EQ(rows.value().size(), 5u);
    EXPECT_EQ(rows.value()[0], person("n3", 3));
    EXPECT_EQ(rows.value()[4], person("n43", 43));
    EXPECT_TRUE(reopened.tree().verify());
}

TEST_F(BTreeIndexTest, RangeAfterRebuild) {
    BTreeIndex index(meta_, acquire(), 4);
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(index.insert(Value::integer(i), person("r", i)).ok());
    }

    index.mark_stale();
    EXPECT_FALSE(index.is_built());

    auto rows = index.range_rows(Value::integer(5), Value::integer(8), true, false);
    ASSERT_TRUE(rows.ok());
    ASSERT_EQ(rows.value().size(), 3u);
    EXPECT_EQ(rows.value()[0][1], Value::integer(5));
    EXPECT_EQ(rows.value()[2][1], Value::integer(7));

    // Rebuilding does not duplicate entries
    ASSERT_TRUE(index.rebuild().ok());
    EXPECT_EQ(index.tree().size(), 20u);

    auto it = index.range(std::nullopt, Value::integer(2));
    ASSERT_TRUE(it.ok());
    Row row;
    size_t count = 0;
    while (it.value().next(&row)) {
        ++count;
    }
    EXPECT_EQ(count, 3u);
}

TEST_F(BTreeIndexTest, RebuiltTreeAnswersLikeTheOriginal) {
    // 30 keys, three rows each, inserted in shuffled order
    std::vector<std::pair<int, int>> entries;
    for (int seq = 0; seq < 90; ++seq) {
        entries.emplace_back(seq % 30, seq);
    }
    std::mt19937 rng(7);
    std::shuffle(entries.begin(), entries.end(), rng);

    const std::vector<std::optional<Value>> bounds = {
        std::nullopt, Value::integer(-1), Value::integer(0), Value::integer(7),
        Value::integer(15), Value::integer(29), Value::integer(40)};

    auto collect = [&](BTreeIndex& index, std::vector<std::vector<Row>>* finds,
                       std::vector<std::vector<Row>>* ranges) {
        for (int key = -1; key <= 30; ++key) {
            auto rows = index.find(Value::integer(key));
            ASSERT_TRUE(rows.ok()) << rows.error().to_string();
            finds->push_back(rows.value());
        }
        for (const auto& lower : bounds) {
            for (const auto& upper : bounds) {
                for (bool lower_inclusive : {true, false}) {
                    for (bool upper_inclusive : {true, false}) {
                        auto rows = index.range_rows(lower, upper, lower_inclusive, upper_inclusive);
                        ASSERT_TRUE(rows.ok()) << rows.error().to_string();
                        ranges->push_back(rows.value());
                    }
                }
            }
        }
    };

    std::vector<std::vector<Row>> finds_before;
    std::vector<std::vector<Row>> ranges_before;
    {
        BTreeIndex index(meta_, acquire(), 4);
        for (const auto& entry : entries) {
            ASSERT_TRUE(index.insert(Value::integer(entry.first),
                                     person("s" + std::to_string(entry.second), entry.first)).ok());
        }
        ASSERT_TRUE(index.tree().verify());
        collect(index, &finds_before, &ranges_before);

        // Same answers from a replay of the file in this session
        index.mark_stale();
        std::vector<std::vector<Row>> finds_stale;
        std::vector<std::vector<Row>> ranges_stale;
        collect(index, &finds_stale, &ranges_stale);
        EXPECT_EQ(finds_stale, finds_before);
        EXPECT_EQ(ranges_stale, ranges_before);

        ASSERT_TRUE(index.flush().ok());
    }
    ASSERT_TRUE(handles_->release(path_).ok());

    BTreeIndex reopened(meta_, acquire(), 4);
    std::vector<std::vector<Row>> finds_after;
    std::vector<std::vector<Row>> ranges_after;
    collect(reopened, &finds_after, &ranges_after);

    EXPECT_TRUE(reopened.tree().verify());
    EXPECT_EQ(reopened.tree().size(), 90u);
    EXPECT_EQ(finds_after, finds_before);
    EXPECT_EQ(ranges_after, ranges_before);

    // Key 0 holds three rows; the unbounded scan sees every entry
    ASSERT_EQ(finds_after[1].size(), 3u);
    ASSERT_EQ(ranges_after.front().size(), 90u);
}

TEST_F(BTreeIndexTest, CorruptPageFailsBuild) {
    FileHandle* handle = acquire();
    {
        auto page = handle->pool->new_page();
        ASSERT_TRUE(page.ok());
        page.value()->get_data()[0] = static_cast<char>(PageType::DATA);
        handle->pool->unpin_page(page.value()->get_page_id(), true);
    }

    BTreeIndex index(meta_, handle, 4);
    auto result = index.find(Value::integer(1));
    EXPECT_EQ(result.error_code(), ErrorCode::PAGE_FORMAT_ERROR);
    EXPECT_FALSE(index.is_built());
}
