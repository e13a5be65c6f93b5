/**
 * @file PersistenceTest.cpp
 * @brief Integration tests for state that outlives a BookStore instance
 * @note Each instance opens its own descriptors. Instances sharing a data
 *       directory see each other's writes through the change detection of the
 *       repositories.
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>

#include <booktracker/error.hpp>
#include <booktracker/store/BookStore.hpp>

using namespace BookTracker;

class PersistenceTest : public ::testing::Test {
  protected:
    void SetUp() override {
        config_.dataDir = "./test_persistence_data";
        std::filesystem::remove_all(config_.dataDir);
        Logger::instance().setMinimumLevel(LogLevel::Off);
    }

    void TearDown() override {
        std::filesystem::remove_all(config_.dataDir);
        Logger::instance().setMinimumLevel(LogLevel::Info);
    }

    std::unique_ptr<BookStore> open() {
        std::error_code ec;
        auto store = std::make_unique<BookStore>(config_, ec);
        EXPECT_FALSE(ec) << ec.message();
        return store;
    }

    static BookFields titled(const std::string& title) {
        return BookFields{title, "", BookStatus::List, ""};
    }

    StoreConfig config_;
};

TEST_F(PersistenceTest, BooksAndIdsSurviveReopen) {
    std::error_code ec;
    {
        auto store = open();
        store->add("alice", titled("A"), ec);
        store->add("bob", titled("B"), ec);
    }

    auto store = open();
    EXPECT_EQ(store->count(ec), 2u);
    auto b = store->get("2", ec);
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->owner, "bob");
    EXPECT_EQ(store->add("alice", titled("C"), ec), "3");
}

TEST_F(PersistenceTest, RepeatedSessionsKeepCounting) {
    std::error_code ec;
    for (int session = 0; session < 5; ++session) {
        auto store = open();
        for (int i = 0; i < 10; ++i) {
            store->add("user" + std::to_string(session), titled("T"), ec);
            ASSERT_FALSE(ec) << "session " << session << " book " << i;
        }
    }

    auto store = open();
    EXPECT_EQ(store->count(ec), 50u);
    auto last = store->get("50", ec);
    ASSERT_NE(last, nullptr);
    EXPECT_EQ(last->owner, "user4");
    EXPECT_EQ(store->idsOwnedBy("user2", ec).front(), 21u);
}

TEST_F(PersistenceTest, DeletedIdNotReusedAfterReopen) {
    std::error_code ec;
    {
        auto store = open();
        store->add("alice", titled("A"), ec);
        store->add("alice", titled("B"), ec);
        ASSERT_NE(store->remove("alice", "2", ec), nullptr);
    }

    auto store = open();
    EXPECT_EQ(store->add("alice", titled("C"), ec), "3");
}

TEST_F(PersistenceTest, LostSequenceFileDoesNotReuseIds) {
    std::error_code ec;
    {
        auto store = open();
        for (int i = 0; i < 4; ++i)
            store->add("alice", titled("T"), ec);
    }
    std::filesystem::remove(config_.sequencePath());

    auto store = open();
    EXPECT_EQ(store->add("alice", titled("New"), ec), "5");
}

TEST_F(PersistenceTest, LostSequenceFileAfterDeletingNewestBook) {
    std::error_code ec;
    {
        auto store = open();
        for (int i = 0; i < 3; ++i)
            store->add("alice", titled("T"), ec);
        ASSERT_NE(store->remove("alice", "3", ec), nullptr);
        ASSERT_NE(store->remove("alice", "1", ec), nullptr);
        EXPECT_EQ(store->count(ec), 1u);
    }
    std::filesystem::remove(config_.sequencePath());

    auto store = open();
    EXPECT_EQ(store->count(ec), 1u);
    EXPECT_EQ(store->add("alice", titled("New"), ec), "4");
    ASSERT_FALSE(ec) << ec.message();

    auto page = store->list(std::nullopt, 0, std::nullopt, ec);
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0]->bookId, "2");
    EXPECT_EQ(page[1]->bookId, "4");
}

TEST_F(PersistenceTest, SecondInstanceSeesWritesOfFirst) {
    std::error_code ec;
    auto writer = open();
    auto reader = open();

    writer->add("alice", titled("A"), ec);
    EXPECT_EQ(reader->list(std::string("alice"), 0, std::nullopt, ec).size(), 1u);

    writer->add("alice", titled("B"), ec);
    auto page = reader->list(std::string("alice"), 0, std::nullopt, ec);
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[1]->fields.title, "B");

    // Ids come from the shared sequence file, so the reader continues after the writer.
    EXPECT_EQ(reader->add("bob", titled("C"), ec), "3");
    EXPECT_EQ(writer->get("3", ec)->owner, "bob");
}

TEST_F(PersistenceTest, HandEditedGarbageLineIsSkipped) {
    std::error_code ec;
    {
        auto store = open();
        store->add("alice", titled("A"), ec);
    }
    {
        std::ofstream out(config_.booksPath(), std::ios::app);
        out << "Book { broken\n";
    }

    auto store = open();
    EXPECT_EQ(store->count(ec), 1u);
    EXPECT_FALSE(ec);
    EXPECT_EQ(store->add("alice", titled("B"), ec), "2");
    EXPECT_EQ(store->count(ec), 2u);
}
