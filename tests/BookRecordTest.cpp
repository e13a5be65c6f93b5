/**
 * @file BookRecordTest.cpp
 * @brief Tests for the Book record, its status set and patches
 */

#include <gtest/gtest.h>

#include <booktracker/error.hpp>
#include <booktracker/record/Book.hpp>
#include <booktracker/record/IdWatermark.hpp>

using namespace BookTracker;

namespace {

util::FieldMap toMap(const util::FieldList& list) {
    util::FieldMap kv;
    for (const auto& entry : list)
        kv.insert(entry);
    return kv;
}

Book sampleBook() {
    return Book("3", "alice.near", BookFields{"Dune", "Desert planet", BookStatus::Reading, "http://x/dune.png"});
}

} // namespace

// =============================================================================
// BookStatus Tests
// =============================================================================

TEST(BookStatusTest, ParsesEachStatus) {
    BookStatus status = BookStatus::List;
    std::error_code ec;

    EXPECT_TRUE(parseBookStatus("Reading", status, ec));
    EXPECT_EQ(status, BookStatus::Reading);
    EXPECT_TRUE(parseBookStatus("Read", status, ec));
    EXPECT_EQ(status, BookStatus::Read);
    EXPECT_TRUE(parseBookStatus("List", status, ec));
    EXPECT_EQ(status, BookStatus::List);
}

TEST(BookStatusTest, RejectsOtherSpellings) {
    BookStatus status = BookStatus::List;
    std::error_code ec;

    EXPECT_FALSE(parseBookStatus("reading", status, ec));
    EXPECT_EQ(ec, StoreErrc::InvalidInput);
    EXPECT_FALSE(parseBookStatus("Finished", status, ec));
    EXPECT_FALSE(parseBookStatus("", status, ec));
}

// =============================================================================
// Serialization Tests
// =============================================================================

TEST(BookRecordTest, ToKvWritesAllMembersInOrder) {
    util::FieldList out;
    sampleBook().toKv(out);

    ASSERT_EQ(out.size(), 6u);
    EXPECT_EQ(out[0].first, "book_id");
    EXPECT_EQ(out[0].second.second, "3");
    EXPECT_EQ(out[1].first, "account_id");
    EXPECT_EQ(out[4].first, "status");
    EXPECT_EQ(out[4].second.second, "Reading");
    for (const auto& entry : out)
        EXPECT_TRUE(entry.second.first) << entry.first;
}

TEST(BookRecordTest, FromKvRestoresBook) {
    util::FieldList out;
    sampleBook().toKv(out);

    Book loaded;
    std::error_code ec;
    ASSERT_TRUE(loaded.fromKv(toMap(out), ec)) << ec.message();
    EXPECT_EQ(loaded.bookId, "3");
    EXPECT_EQ(loaded.owner, "alice.near");
    EXPECT_EQ(loaded.fields, sampleBook().fields);
    EXPECT_EQ(loaded.sequence(), 3u);
}

TEST(BookRecordTest, FromKvRejectsMissingOrExtraKey) {
    util::FieldList out;
    sampleBook().toKv(out);
    std::error_code ec;

    util::FieldMap missing = toMap(out);
    missing.erase("image");
    Book a;
    EXPECT_FALSE(a.fromKv(missing, ec));
    EXPECT_EQ(ec, std::errc::invalid_argument);

    util::FieldMap extra = toMap(out);
    extra["isbn"] = {true, "123"};
    Book b;
    EXPECT_FALSE(b.fromKv(extra, ec));
}

TEST(BookRecordTest, FromKvRejectsBadIdOwnerOrStatus) {
    util::FieldList out;
    sampleBook().toKv(out);
    std::error_code ec;

    for (const auto& [key, value] :
         std::vector<std::pair<std::string, util::FieldValue>>{{"book_id", {true, "0"}},
                                                                {"book_id", {true, "abc"}},
                                                                {"book_id", {false, "3"}},
                                                                {"account_id", {true, ""}},
                                                                {"status", {true, "Done"}}}) {
        util::FieldMap kv = toMap(out);
        kv[key] = value;
        Book loaded;
        EXPECT_FALSE(loaded.fromKv(kv, ec)) << key << "=" << value.second;
    }
}

TEST(BookRecordTest, FailedFromKvLeavesRecordUntouched) {
    Book book = sampleBook();
    std::error_code ec;

    EXPECT_FALSE(book.fromKv({{"book_id", {true, "9"}}}, ec));
    EXPECT_EQ(book.bookId, "3");
    EXPECT_EQ(book.fields.title, "Dune");
}

TEST(BookRecordTest, CloneIsDeepCopy) {
    Book book = sampleBook();
    auto copy = book.clone();
    book.fields.title = "Changed";

    auto* cloned = dynamic_cast<Book*>(copy.get());
    ASSERT_NE(cloned, nullptr);
    EXPECT_EQ(cloned->fields.title, "Dune");
    EXPECT_STREQ(cloned->typeName(), "Book");
}

// =============================================================================
// IdWatermark Tests
// =============================================================================

TEST(IdWatermarkTest, LineFormat) {
    util::FieldList out;
    IdWatermark("books", 42).toKv(out);
    EXPECT_EQ(util::formatLine("IdWatermark", out),
              "IdWatermark { \"sequence\": \"books\", \"last_id\": 42 }\n");

    IdWatermark restored;
    std::error_code ec;
    ASSERT_TRUE(restored.fromKv(toMap(out), ec)) << ec.message();
    EXPECT_EQ(restored.id(), "books");
    EXPECT_EQ(restored.lastId, 42u);
}

TEST(IdWatermarkTest, RejectsQuotedOrMissingLastId) {
    IdWatermark mark;
    std::error_code ec;

    util::FieldMap quoted{{"sequence", {true, "books"}}, {"last_id", {true, "3"}}};
    EXPECT_FALSE(mark.fromKv(quoted, ec));
    EXPECT_EQ(ec, std::errc::invalid_argument);

    util::FieldMap missing{{"sequence", {true, "books"}}};
    EXPECT_FALSE(mark.fromKv(missing, ec));

    util::FieldMap negative{{"sequence", {true, "books"}}, {"last_id", {false, "-1"}}};
    EXPECT_FALSE(mark.fromKv(negative, ec));
}

// =============================================================================
// Fields and Patch Tests
// =============================================================================

TEST(BookFieldsTest, TitleRequired) {
    std::error_code ec;
    BookFields fields;

    EXPECT_FALSE(fields.validate(ec));
    EXPECT_EQ(ec, StoreErrc::InvalidInput);

    fields.title = "T";
    EXPECT_TRUE(fields.validate(ec));
}

TEST(BookPatchTest, EmptyPatchRejected) {
    std::error_code ec;
    BookPatch patch;

    EXPECT_TRUE(patch.empty());
    EXPECT_FALSE(patch.validate(ec));
    EXPECT_EQ(ec, StoreErrc::InvalidInput);
}

TEST(BookPatchTest, EmptyTitleRejectedOtherEmptyValuesAllowed) {
    std::error_code ec;
    BookPatch clearTitle;
    clearTitle.title = "";
    EXPECT_FALSE(clearTitle.validate(ec));

    BookPatch clearImage;
    clearImage.image = "";
    EXPECT_TRUE(clearImage.validate(ec));
}

TEST(BookPatchTest, ApplyChangesOnlyPresentMembers) {
    Book book = sampleBook();
    BookPatch patch;
    patch.status = BookStatus::Read;
    patch.description = "";

    book.apply(patch);

    EXPECT_EQ(book.fields.status, BookStatus::Read);
    EXPECT_EQ(book.fields.description, "");
    EXPECT_EQ(book.fields.title, "Dune");
    EXPECT_EQ(book.fields.image, "http://x/dune.png");
    EXPECT_EQ(book.bookId, "3");
    EXPECT_EQ(book.owner, "alice.near");
}

// =============================================================================
// Error Category Tests
// =============================================================================

TEST(StoreErrcTest, NamesAndMessages) {
    std::error_code ec = StoreErrc::NotFound;

    EXPECT_STREQ(ec.category().name(), "booktracker");
    EXPECT_EQ(errorCodeName(ec), "NotFound");
    EXPECT_EQ(ec.message(), "Book does not exist");
    EXPECT_EQ(errorCodeName(StoreErrc::Unauthorized), "Unauthorized");
    EXPECT_EQ(errorCodeName(StoreErrc::InvalidInput), "InvalidInput");
    EXPECT_EQ(errorCodeName(std::make_error_code(std::errc::io_error)), "IoError");
}
