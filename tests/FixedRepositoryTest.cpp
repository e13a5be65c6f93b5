/**
 * @file FixedRepositoryTest.cpp
 * @brief Unit tests for the mmap-backed fixed-length repository with named counters
 */

#include <gtest/gtest.h>
#include <sys/stat.h>

#include <memory>

#include <booktracker/record/SequenceRecord.hpp>
#include <booktracker/repository/UniformFixedRepositoryImpl.hpp>

using namespace BookTracker;

// =============================================================================
// SequenceRecord Repository Tests
// =============================================================================

class FixedRepositoryTest : public ::testing::Test {
  protected:
    void SetUp() override {
        testFile_ = "./test_fixed_sequence.db";
        ::remove(testFile_.c_str());
        repo_ = std::make_unique<UniformFixedRepositoryImpl<SequenceRecord>>(testFile_, ec_);
        ASSERT_FALSE(ec_) << "Repository init failed: " << ec_.message();
    }

    void TearDown() override {
        repo_.reset();
        ::remove(testFile_.c_str());
    }

    void saveCounters() {
        ASSERT_TRUE(repo_->save(SequenceRecord("books", 3), ec_));
        ASSERT_TRUE(repo_->save(SequenceRecord("shelves", 7), ec_));
        ASSERT_TRUE(repo_->save(SequenceRecord("reviews", 11), ec_));
    }

    off_t fileSize() const {
        struct stat st{};
        if (::stat(testFile_.c_str(), &st) != 0)
            return -1;
        return st.st_size;
    }

    std::string testFile_;
    std::error_code ec_;
    std::unique_ptr<UniformFixedRepositoryImpl<SequenceRecord>> repo_;
};

TEST_F(FixedRepositoryTest, FindAllKeepsInsertionOrder) {
    saveCounters();

    auto all = repo_->findAll(ec_);
    ASSERT_FALSE(ec_) << ec_.message();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0]->getId(), "books");
    EXPECT_EQ(all[1]->getId(), "shelves");
    EXPECT_EQ(all[2]->getId(), "reviews");
    EXPECT_EQ(all[2]->value, 11);
    EXPECT_EQ(fileSize(), static_cast<off_t>(3 * SequenceRecord().recordSize()));
}

TEST_F(FixedRepositoryTest, SaveExistingIdOverwritesInPlace) {
    saveCounters();
    ASSERT_TRUE(repo_->save(SequenceRecord("shelves", 8), ec_));

    EXPECT_EQ(repo_->count(ec_), 3u);
    auto all = repo_->findAll(ec_);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[1]->getId(), "shelves");
    EXPECT_EQ(all[1]->value, 8);
}

TEST_F(FixedRepositoryTest, DeleteMiddleShiftsTail) {
    saveCounters();

    ASSERT_TRUE(repo_->deleteById("shelves", ec_));
    ASSERT_FALSE(ec_);
    EXPECT_EQ(repo_->count(ec_), 2u);
    EXPECT_FALSE(repo_->existsById("shelves", ec_));
    EXPECT_EQ(fileSize(), static_cast<off_t>(2 * SequenceRecord().recordSize()));

    auto all = repo_->findAll(ec_);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0]->getId(), "books");
    EXPECT_EQ(all[1]->getId(), "reviews");

    // The shifted record is still found by id after the slot map rebuild.
    auto reviews = repo_->findById("reviews", ec_);
    ASSERT_NE(reviews, nullptr);
    EXPECT_EQ(reviews->value, 11);
}

TEST_F(FixedRepositoryTest, DeleteLastAndMissing) {
    saveCounters();

    ASSERT_TRUE(repo_->deleteById("reviews", ec_));
    EXPECT_EQ(repo_->count(ec_), 2u);

    // Deleting an unknown id is not an error.
    EXPECT_TRUE(repo_->deleteById("nothing", ec_));
    EXPECT_FALSE(ec_);
    EXPECT_EQ(repo_->count(ec_), 2u);
}

TEST_F(FixedRepositoryTest, ExistsById) {
    EXPECT_FALSE(repo_->existsById("books", ec_));
    EXPECT_FALSE(ec_);

    ASSERT_TRUE(repo_->save(SequenceRecord("books", 1), ec_));
    EXPECT_TRUE(repo_->existsById("books", ec_));
    EXPECT_FALSE(repo_->existsById("Books", ec_));
}

TEST_F(FixedRepositoryTest, ReopenAfterDelete) {
    saveCounters();
    ASSERT_TRUE(repo_->deleteById("books", ec_));
    repo_.reset();

    UniformFixedRepositoryImpl<SequenceRecord> reopened(testFile_, ec_);
    ASSERT_FALSE(ec_) << ec_.message();
    EXPECT_EQ(reopened.count(ec_), 2u);
    EXPECT_FALSE(reopened.existsById("books", ec_));

    auto shelves = reopened.findById("shelves", ec_);
    ASSERT_NE(shelves, nullptr);
    EXPECT_EQ(shelves->value, 7);
}

TEST_F(FixedRepositoryTest, OverlongIdRejectedWithoutGrowing) {
    saveCounters();

    EXPECT_FALSE(repo_->save(SequenceRecord("seventeen_chars_x", 1), ec_));
    EXPECT_EQ(ec_, std::errc::invalid_argument);
    EXPECT_EQ(fileSize(), static_cast<off_t>(3 * SequenceRecord().recordSize()));
    EXPECT_EQ(repo_->count(ec_), 3u);
    EXPECT_FALSE(ec_);
}

TEST_F(FixedRepositoryTest, SecondInstanceSeesDelete) {
    saveCounters();
    UniformFixedRepositoryImpl<SequenceRecord> other(testFile_, ec_);
    ASSERT_FALSE(ec_);
    ASSERT_EQ(other.count(ec_), 3u);

    ASSERT_TRUE(repo_->deleteById("books", ec_));

    EXPECT_EQ(other.count(ec_), 2u);
    EXPECT_EQ(other.findById("books", ec_), nullptr);
    EXPECT_FALSE(ec_);
}
