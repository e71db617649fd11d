#include "persistence/journal.hpp"

#include "common/error.hpp"
#include "persistence/binary_io.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <gtest/gtest.h>

namespace sortkv::persistence {

using namespace std::string_literals;

// ── Fixture ──────────────────────────────────────────────────────────────────

class JournalTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a unique temp directory for each test.
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("journal_test_" + std::string(info->name()));
        // Clean up any stale directory from a previous crashed run.
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        journal_path_ = test_dir_ / "store.journal";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    // Flip one byte of the journal file at `pos`.
    void corrupt_byte(off_t pos) {
        int fd = ::open(journal_path_.c_str(), O_RDWR);
        ASSERT_GE(fd, 0);
        ASSERT_EQ(::lseek(fd, pos, SEEK_SET), pos);
        uint8_t byte = 0;
        ASSERT_EQ(::read(fd, &byte, 1), 1);
        byte ^= 0xFF;
        ASSERT_EQ(::lseek(fd, pos, SEEK_SET), pos);
        ASSERT_EQ(::write(fd, &byte, 1), 1);
        ::close(fd);
    }

    std::filesystem::path test_dir_;
    std::filesystem::path journal_path_;
};

// ── Open / Close ─────────────────────────────────────────────────────────────

TEST_F(JournalTest, OpenCreatesNewFileWithHeader) {
    Journal journal(journal_path_);
    auto ec = journal.open();
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_TRUE(journal.is_open());
    EXPECT_EQ(std::filesystem::file_size(journal_path_), kJournalHeaderSize);
}

TEST_F(JournalTest, OpenIdempotentWhenAlreadyOpen) {
    Journal journal(journal_path_);
    ASSERT_FALSE(journal.open());
    auto ec = journal.open();  // second call
    EXPECT_FALSE(ec) << ec.message();
    EXPECT_TRUE(journal.is_open());
}

TEST_F(JournalTest, CloseMarksNotOpen) {
    Journal journal(journal_path_);
    ASSERT_FALSE(journal.open());
    journal.close();
    EXPECT_FALSE(journal.is_open());
}

TEST_F(JournalTest, OpenRejectsForeignFile) {
    {
        int fd = ::open(journal_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        ASSERT_GE(fd, 0);
        const char* garbage = "BADMAGICDATA";
        ASSERT_EQ(::write(fd, garbage, 12), 12);
        ::close(fd);
    }

    Journal journal(journal_path_);
    auto ec = journal.open();
    EXPECT_EQ(ec, StoreErrc::corrupt_data);
    EXPECT_FALSE(journal.is_open());
}

// ── Append / Replay ──────────────────────────────────────────────────────────

TEST_F(JournalTest, ReplayEmptyJournal) {
    {
        Journal journal(journal_path_);
        ASSERT_FALSE(journal.open());
    }

    std::vector<Entry> entries{{"stale", "data"}};
    auto ec = Journal::replay(journal_path_, entries);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_TRUE(entries.empty());
}

TEST_F(JournalTest, AppendAndReplayInOrder) {
    const std::vector<Entry> batch{
        {"b", "2"}, {"a", "1"}, {"b", "3"},
    };
    {
        Journal journal(journal_path_);
        ASSERT_FALSE(journal.open());
        ASSERT_FALSE(journal.append(batch, /*durable=*/false));
        ASSERT_FALSE(journal.append(std::vector<Entry>{{"c", "4"}},
                                    /*durable=*/true));
    }

    std::vector<Entry> entries;
    auto ec = Journal::replay(journal_path_, entries);
    ASSERT_FALSE(ec) << ec.message();
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0], (Entry{"b", "2"}));
    EXPECT_EQ(entries[1], (Entry{"a", "1"}));
    EXPECT_EQ(entries[2], (Entry{"b", "3"}));
    EXPECT_EQ(entries[3], (Entry{"c", "4"}));
}

TEST_F(JournalTest, BinaryKeyAndValueRoundTrip) {
    const Entry entry{"\x00k\x00"s, "\x00\xff\x00"s};
    {
        Journal journal(journal_path_);
        ASSERT_FALSE(journal.open());
        ASSERT_FALSE(journal.append(std::vector<Entry>{entry}, false));
    }

    std::vector<Entry> entries;
    ASSERT_FALSE(Journal::replay(journal_path_, entries));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0], entry);
}

TEST_F(JournalTest, EmptyKeyAndValue) {
    {
        Journal journal(journal_path_);
        ASSERT_FALSE(journal.open());
        ASSERT_FALSE(journal.append(std::vector<Entry>{{"", ""}}, false));
    }

    std::vector<Entry> entries;
    ASSERT_FALSE(Journal::replay(journal_path_, entries));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].first.empty());
    EXPECT_TRUE(entries[0].second.empty());
}

TEST_F(JournalTest, AppendAfterReopenPreservesPrevious) {
    {
        Journal journal(journal_path_);
        ASSERT_FALSE(journal.open());
        ASSERT_FALSE(journal.append(std::vector<Entry>{{"first", "1"}}, false));
    }
    {
        Journal journal(journal_path_);
        ASSERT_FALSE(journal.open());
        ASSERT_FALSE(journal.append(std::vector<Entry>{{"second", "2"}}, false));
    }

    std::vector<Entry> entries;
    ASSERT_FALSE(Journal::replay(journal_path_, entries));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, "first");
    EXPECT_EQ(entries[1].first, "second");
}

TEST_F(JournalTest, ResetDropsAllRecords) {
    Journal journal(journal_path_);
    ASSERT_FALSE(journal.open());
    ASSERT_FALSE(journal.append(std::vector<Entry>{{"k", "v"}}, false));

    auto ec = journal.reset();
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(std::filesystem::file_size(journal_path_), kJournalHeaderSize);

    // Appends continue after the header.
    ASSERT_FALSE(journal.append(std::vector<Entry>{{"after", "reset"}}, true));
    journal.close();

    std::vector<Entry> entries;
    ASSERT_FALSE(Journal::replay(journal_path_, entries));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0], (Entry{"after", "reset"}));
}

// ── Corruption ───────────────────────────────────────────────────────────────

TEST_F(JournalTest, CorruptedRecordCrcDetected) {
    {
        Journal journal(journal_path_);
        ASSERT_FALSE(journal.open());
        ASSERT_FALSE(journal.append(std::vector<Entry>{{"foo", "bar"}}, false));
    }

    // Inside the key bytes: header(6) + type(1) + key_len(4).
    corrupt_byte(static_cast<off_t>(kJournalHeaderSize + 5));

    std::vector<Entry> entries;
    auto ec = Journal::replay(journal_path_, entries);
    EXPECT_EQ(ec, StoreErrc::corrupt_data) << "Expected CRC error";
}

TEST_F(JournalTest, UnknownRecordTypeDetected) {
    {
        Journal journal(journal_path_);
        ASSERT_FALSE(journal.open());
        ASSERT_FALSE(journal.append(std::vector<Entry>{{"foo", "bar"}}, false));
    }

    corrupt_byte(static_cast<off_t>(kJournalHeaderSize));

    std::vector<Entry> entries;
    EXPECT_EQ(Journal::replay(journal_path_, entries), StoreErrc::corrupt_data);
}

TEST_F(JournalTest, InvalidMagicDetected) {
    {
        int fd = ::open(journal_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        ASSERT_GE(fd, 0);
        const char* garbage = "BADMAGICDATA";
        ASSERT_EQ(::write(fd, garbage, 12), 12);
        ::close(fd);
    }

    std::vector<Entry> entries;
    auto ec = Journal::replay(journal_path_, entries);
    EXPECT_EQ(ec, StoreErrc::corrupt_data) << "Expected error for invalid magic";
}

TEST_F(JournalTest, TruncatedHeaderDetected) {
    {
        int fd = ::open(journal_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        ASSERT_GE(fd, 0);
        ASSERT_EQ(::write(fd, "SKV", 3), 3);
        ::close(fd);
    }

    std::vector<Entry> entries;
    EXPECT_TRUE(Journal::replay(journal_path_, entries));
}

TEST_F(JournalTest, TornTailIsDropped) {
    {
        Journal journal(journal_path_);
        ASSERT_FALSE(journal.open());
        ASSERT_FALSE(journal.append(std::vector<Entry>{{"kept", "1"}}, false));
        ASSERT_FALSE(journal.append(std::vector<Entry>{{"torn", "2"}}, false));
    }

    // Cut the last record in half.
    auto size = std::filesystem::file_size(journal_path_);
    std::filesystem::resize_file(journal_path_, size - 6);

    std::vector<Entry> entries;
    auto ec = Journal::replay(journal_path_, entries);
    ASSERT_FALSE(ec) << ec.message();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].first, "kept");
}

TEST_F(JournalTest, ReplayMissingFileFails) {
    std::vector<Entry> entries;
    EXPECT_TRUE(Journal::replay(test_dir_ / "absent.journal", entries));
}

TEST_F(JournalTest, AppendFailsWhenNotOpen) {
    Journal journal(journal_path_);
    auto ec = journal.append(std::vector<Entry>{{"k", "v"}}, false);
    EXPECT_EQ(ec, std::errc::bad_file_descriptor);
}

// ── CRC32 / serialisation ────────────────────────────────────────────────────

TEST_F(JournalTest, Crc32EmptyInput) {
    EXPECT_EQ(crc32(nullptr, 0), 0x00000000u);
}

TEST_F(JournalTest, Crc32KnownValue) {
    // CRC32 of "123456789" is 0xCBF43926.
    const std::string input = "123456789";
    auto c = crc32(reinterpret_cast<const uint8_t*>(input.data()), input.size());
    EXPECT_EQ(c, 0xCBF43926u);
}

TEST_F(JournalTest, SerialisePutProducesExpectedSize) {
    std::vector<uint8_t> buf;
    serialise_put(buf, {"abc", "defgh"});
    // type(1) + key_len(4) + key(3) + value_len(4) + value(5) + crc(4) = 21
    EXPECT_EQ(buf.size(), 21u);
    EXPECT_EQ(buf[0], kRecordTypePut);
}

TEST_F(JournalTest, PathReturnsConstructorPath) {
    Journal journal(journal_path_);
    EXPECT_EQ(journal.path(), journal_path_);
}

} // namespace sortkv::persistence
