/**
 * @file IdAllocatorTest.cpp
 * @brief Tests for IdAllocator on top of the fixed-length repository
 */

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <booktracker/store/IdAllocator.hpp>
#include <booktracker/util/Logger.hpp>

using namespace BookTracker;

class IdAllocatorTest : public ::testing::Test {
  protected:
    void SetUp() override {
        testFile_ = "./test_sequence.db";
        ::remove(testFile_.c_str());
        Logger::instance().setMinimumLevel(LogLevel::Off);
    }

    void TearDown() override {
        ::remove(testFile_.c_str());
        Logger::instance().setMinimumLevel(LogLevel::Info);
    }

    std::string testFile_;
    std::error_code ec_;
};

TEST_F(IdAllocatorTest, IssuesIncreasingDecimalIds) {
    IdAllocator ids(testFile_, "books", ec_);
    ASSERT_FALSE(ec_) << ec_.message();

    EXPECT_EQ(ids.current(ec_), 0u);
    EXPECT_EQ(ids.next(ec_), "1");
    EXPECT_EQ(ids.next(ec_), "2");
    EXPECT_EQ(ids.next(ec_), "3");
    EXPECT_EQ(ids.current(ec_), 3u);
    EXPECT_FALSE(ec_);
}

TEST_F(IdAllocatorTest, CounterSurvivesReopen) {
    {
        IdAllocator ids(testFile_, "books", ec_);
        ASSERT_FALSE(ec_);
        ids.next(ec_);
        ids.next(ec_);
    }

    IdAllocator reopened(testFile_, "books", ec_);
    ASSERT_FALSE(ec_);
    EXPECT_EQ(reopened.next(ec_), "3");
}

TEST_F(IdAllocatorTest, NamedCountersAreIndependent) {
    IdAllocator books(testFile_, "books", ec_);
    ASSERT_FALSE(ec_);
    IdAllocator shelves(testFile_, "shelves", ec_);
    ASSERT_FALSE(ec_);

    EXPECT_EQ(books.next(ec_), "1");
    EXPECT_EQ(books.next(ec_), "2");
    EXPECT_EQ(shelves.next(ec_), "1");
    EXPECT_EQ(books.next(ec_), "3");
}

TEST_F(IdAllocatorTest, SecondInstanceSeesFirstInstanceWrites) {
    IdAllocator first(testFile_, "books", ec_);
    ASSERT_FALSE(ec_);
    IdAllocator second(testFile_, "books", ec_);
    ASSERT_FALSE(ec_);

    EXPECT_EQ(first.next(ec_), "1");
    EXPECT_EQ(second.next(ec_), "2");
    EXPECT_EQ(first.next(ec_), "3");
}

TEST_F(IdAllocatorTest, AdvanceToNeverLowers) {
    IdAllocator ids(testFile_, "books", ec_);
    ASSERT_FALSE(ec_);

    ASSERT_TRUE(ids.advanceTo(10, ec_));
    EXPECT_EQ(ids.current(ec_), 10u);

    ASSERT_TRUE(ids.advanceTo(4, ec_));
    EXPECT_EQ(ids.current(ec_), 10u);
    EXPECT_EQ(ids.next(ec_), "11");
}

TEST_F(IdAllocatorTest, TruncatedFileRejected) {
    int fd = ::open(testFile_.c_str(), O_CREAT | O_RDWR, 0644);
    ASSERT_GE(fd, 0);
    ASSERT_EQ(::write(fd, "Seq", 3), 3);
    ::close(fd);

    IdAllocator ids(testFile_, "books", ec_);
    EXPECT_EQ(ec_, std::errc::invalid_argument);
}

TEST_F(IdAllocatorTest, OverlongNameLeavesSharedFileUsable) {
    IdAllocator books(testFile_, "books", ec_);
    ASSERT_FALSE(ec_);
    EXPECT_EQ(books.next(ec_), "1");

    // Counter names are stored in a 16-byte id field.
    IdAllocator tooLong(testFile_, "a_seventeen_chars", ec_);
    ASSERT_FALSE(ec_);
    EXPECT_EQ(tooLong.next(ec_), "");
    EXPECT_EQ(ec_, std::errc::invalid_argument);

    EXPECT_EQ(books.next(ec_), "2");
    EXPECT_FALSE(ec_) << ec_.message();

    IdAllocator reopened(testFile_, "books", ec_);
    ASSERT_FALSE(ec_) << ec_.message();
    EXPECT_EQ(reopened.current(ec_), 2u);
}
