#include <gtest/gtest.h>
#include <minirel/storage/handle_pool.hpp>
#include <filesystem>

using namespace minirel;
namespace fs = std::filesystem;

class HandlePoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "handle_pool_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        handles_ = std::make_unique<HandlePool>();
    }

    void TearDown() override {
        handles_.reset();
        fs::remove_all(test_dir_);
    }

    fs::path test_dir_;
    std::unique_ptr<HandlePool> handles_;
};

TEST_F(HandlePoolTest, SamePathSharesOneHandle) {
    fs::path path = test_dir_ / "t.tbl";

    auto a = handles_->acquire(path, 4096, 8);
    ASSERT_TRUE(a.ok()) << a.error().to_string();
    auto b = handles_->acquire(test_dir_ / "." / "t.tbl", 4096, 8);
    ASSERT_TRUE(b.ok());

    EXPECT_EQ(a.value(), b.value());
    EXPECT_EQ(handles_->size(), 1u);
    EXPECT_EQ(handles_->ref_count(path), 2u);
}

TEST_F(HandlePoolTest, AcquirersShareCounters) {
    fs::path path = test_dir_ / "t.tbl";
    FileHandle* a = handles_->acquire(path, 4096, 8).value();
    FileHandle* b = handles_->acquire(path, 4096, 8).value();

    auto page = a->pool->new_page();
    ASSERT_TRUE(page.ok());
    a->pool->unpin_page(0, true);

    ASSERT_TRUE(b->pool->fetch_page(0).ok());
    b->pool->unpin_page(0, false);

    EXPECT_EQ(a->pool->stats().hits, 1u);
    EXPECT_TRUE(b->pool->is_dirty(0));
}

TEST_F(HandlePoolTest, DifferentFilesGetDifferentHandles) {
    FileHandle* a = handles_->acquire(test_dir_ / "a.tbl", 4096, 8).value();
    FileHandle* b = handles_->acquire(test_dir_ / "b.tbl", 4096, 8).value();
    EXPECT_NE(a, b);
    EXPECT_EQ(handles_->size(), 2u);
}

TEST_F(HandlePoolTest, FirstAcquireDecidesPoolSettings) {
    fs::path path = test_dir_ / "t.tbl";
    FileHandle* a = handles_->acquire(path, 4096, 3, EvictionPolicy::CLOCK, true).value();
    FileHandle* b = handles_->acquire(path, 4096, 50).value();

    EXPECT_EQ(b->pool->get_pool_size(), 3u);
    EXPECT_EQ(b->pool->policy(), EvictionPolicy::CLOCK);
    EXPECT_TRUE(a->pool->eviction_log_enabled());
}

TEST_F(HandlePoolTest, PageSizeMismatchIsInvalid) {
    fs::path path = test_dir_ / "t.tbl";
    ASSERT_TRUE(handles_->acquire(path, 4096, 8).ok());

    auto result = handles_->acquire(path, 1024, 8);
    EXPECT_EQ(result.error_code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(handles_->ref_count(path), 1u);
}

TEST_F(HandlePoolTest, ZeroCapacityIsInvalid) {
    auto result = handles_->acquire(test_dir_ / "t.tbl", 4096, 0);
    EXPECT_EQ(result.error_code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(handles_->size(), 0u);
}

TEST_F(HandlePoolTest, LastReleaseFlushesAndCloses) {
    fs::path path = test_dir_ / "t.tbl";
    FileHandle* handle = handles_->acquire(path, 1024, 8).value();
    ASSERT_TRUE(handles_->acquire(path, 1024, 8).ok());

    auto page = handle->pool->new_page();
    ASSERT_TRUE(page.ok());
    page.value()->get_data()[3] = 'w';
    handle->pool->unpin_page(0, true);

    ASSERT_TRUE(handles_->release(path).ok());
    EXPECT_TRUE(handles_->contains(path));
    EXPECT_EQ(handles_->ref_count(path), 1u);

    ASSERT_TRUE(handles_->release(path).ok());
    EXPECT_FALSE(handles_->contains(path));
    EXPECT_EQ(handles_->ref_count(path), 0u);

    // Reopening reads what the closing flush wrote
    FileHandle* reopened = handles_->acquire(path, 1024, 8).value();
    auto fetched = reopened->pool->fetch_page(0);
    ASSERT_TRUE(fetched.ok());
    EXPECT_EQ(fetched.value()->get_data()[3], 'w');
    reopened->pool->unpin_page(0, false);
}

TEST_F(HandlePoolTest, ReleaseUnknownPath) {
    auto result = handles_->release(test_dir_ / "missing.tbl");
    EXPECT_EQ(result.error_code(), ErrorCode::NOT_FOUND);
}

TEST_F(HandlePoolTest, CloseAllDropsEveryHandle) {
    ASSERT_TRUE(handles_->acquire(test_dir_ / "a.tbl", 4096, 8).ok());
    ASSERT_TRUE(handles_->acquire(test_dir_ / "b.tbl", 4096, 8).ok());
    ASSERT_TRUE(handles_->acquire(test_dir_ / "b.tbl", 4096, 8).ok());

    ASSERT_TRUE(handles_->flush_all().ok());
    ASSERT_TRUE(handles_->close_all().ok());
    EXPECT_EQ(handles_->size(), 0u);
}
