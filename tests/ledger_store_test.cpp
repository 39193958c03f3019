#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "stockledger/checkpoint.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/helpers.hpp"
#include "stockledger/ledger_store.hpp"
#include "stockledger/logging.hpp"

using namespace stockledger;

namespace {

InventoryChangeEvent make_event(int64_t warehouse_id, int64_t product_id, ChangeType type,
                                int64_t delta) {
    InventoryChangeEvent event;
    *event.mutable_key() = helpers::make_key(warehouse_id, product_id);
    event.set_change_type(type);
    event.set_quantity_delta(delta);
    *event.mutable_occurred_at() = helpers::now();
    return event;
}

class FailingStore : public InMemoryLedgerStore {
public:
    bool fail = false;

protected:
    void persist(const std::vector<InventoryChangeEvent>&) override {
        if (fail) throw StorageError("simulated write failure");
    }
};

std::string temp_path(const std::string& suffix) {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    auto path = std::filesystem::temp_directory_path() /
                (std::string("stockledger_") + info->name() + suffix);
    std::filesystem::remove(path);
    return path.string();
}

} // anonymous namespace

// =============================================================================
// InMemoryLedgerStore Tests
// =============================================================================

TEST(LedgerStoreTest, Append_ShouldAssignIncreasingIdsAcrossKeys) {
    InMemoryLedgerStore store;
    auto a = make_event(1, 10, RECEIVED, 5);
    auto b = make_event(1, 11, RECEIVED, 7);
    auto c = make_event(1, 10, SOLD, -2);

    EXPECT_EQ(store.append(a), 1);
    EXPECT_EQ(store.append(b), 2);
    EXPECT_EQ(store.append(c), 3);
    EXPECT_EQ(c.event_id(), 3);
    EXPECT_EQ(store.size(), 3u);
    EXPECT_EQ(store.max_event_id(), 3);
    EXPECT_EQ(store.max_event_id({1, 10}), 3);
    EXPECT_EQ(store.max_event_id({1, 11}), 2);
    EXPECT_EQ(store.max_event_id({9, 9}), 0);
}

TEST(LedgerStoreTest, AppendBatch_ShouldAssignConsecutiveIds) {
    InMemoryLedgerStore store;
    auto first = make_event(1, 10, RECEIVED, 5);
    store.append(first);

    std::vector<InventoryChangeEvent> batch{make_event(1, 10, SOLD, -1), make_event(2, 10, RECEIVED, 3)};
    auto ids = store.append_batch(batch);

    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], 2);
    EXPECT_EQ(ids[1], 3);
    EXPECT_EQ(batch[1].event_id(), 3);
}

TEST(LedgerStoreTest, ReadFrom_ShouldReturnOnlyLaterEventsOfTheKey) {
    InMemoryLedgerStore store;
    for (int i = 0; i < 5; ++i) {
        auto own = make_event(1, 10, RECEIVED, i + 1);
        auto other = make_event(1, 11, RECEIVED, 1);
        store.append(own);
        store.append(other);
    }

    auto events = store.read_from({1, 10}, 3);

    // Ids of key (1,10) are 1,3,5,7,9.
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].event_id(), 5);
    EXPECT_EQ(events[2].event_id(), 9);
    EXPECT_TRUE(store.read_from({4, 4}, 0).empty());
}

TEST(LedgerStoreTest, ReadRange_ShouldBeExclusiveBelowAndInclusiveAbove) {
    InMemoryLedgerStore store;
    for (int i = 0; i < 6; ++i) {
        auto event = make_event(1, 10, RECEIVED, 1);
        store.append(event);
    }

    auto events = store.read_range({1, 10}, 2, 4);

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].event_id(), 3);
    EXPECT_EQ(events[1].event_id(), 4);
    EXPECT_TRUE(store.read_range({1, 10}, 4, 4).empty());
}

TEST(LedgerStoreTest, Keys_ShouldBeSorted) {
    InMemoryLedgerStore store;
    auto a = make_event(2, 5, RECEIVED, 1);
    auto b = make_event(1, 7, RECEIVED, 1);
    auto c = make_event(1, 3, RECEIVED, 1);
    store.append(a);
    store.append(b);
    store.append(c);

    auto keys = store.keys();

    ASSERT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys[0], (KeyRef{1, 3}));
    EXPECT_EQ(keys[1], (KeyRef{1, 7}));
    EXPECT_EQ(keys[2], (KeyRef{2, 5}));
}

TEST(LedgerStoreTest, AppendBatch_WhenPersistFails_ShouldStoreNothingAndReuseIds) {
    FailingStore store;
    auto first = make_event(1, 10, RECEIVED, 5);
    store.append(first);

    store.fail = true;
    std::vector<InventoryChangeEvent> batch{make_event(1, 10, SOLD, -1), make_event(1, 11, RECEIVED, 2)};
    EXPECT_THROW(store.append_batch(batch), StorageError);

    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.max_event_id(), 1);
    EXPECT_TRUE(store.read_from({1, 11}, 0).empty());

    store.fail = false;
    auto next = make_event(1, 11, RECEIVED, 2);
    EXPECT_EQ(store.append(next), 2);
}

// =============================================================================
// JournalLedgerStore Tests
// =============================================================================

class JournalLedgerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_level(LogLevel::Error);
        path_ = temp_path(".journal");
    }

    void TearDown() override {
        std::filesystem::remove(path_);
        set_log_level(LogLevel::Info);
    }

    std::string path_;
};

TEST_F(JournalLedgerStoreTest, Reopen_ShouldReloadEveryEvent) {
    // Given a journal with a single append and a batch
    {
        JournalLedgerStore store(path_);
        auto event = make_event(1, 10, RECEIVED, 50);
        store.append(event);
        std::vector<InventoryChangeEvent> batch{make_event(1, 10, SOLD, -5), make_event(1, 11, RECEIVED, 8)};
        store.append_batch(batch);
    }

    // When I reopen it
    JournalLedgerStore reopened(path_);

    // Then all events are back with their ids
    EXPECT_EQ(reopened.records_loaded(), 2u);
    EXPECT_EQ(reopened.size(), 3u);
    EXPECT_EQ(reopened.max_event_id(), 3);
    auto events = reopened.read_from({1, 10}, 0);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].quantity_delta(), -5);

    // And new appends continue after the last id
    auto next = make_event(1, 11, SOLD, -1);
    EXPECT_EQ(reopened.append(next), 4);
}

TEST_F(JournalLedgerStoreTest, Reopen_WithTornTailRecord_ShouldTruncateIt) {
    {
        JournalLedgerStore store(path_);
        auto event = make_event(1, 10, RECEIVED, 50);
        store.append(event);
    }
    auto intact_size = std::filesystem::file_size(path_);

    // Given a record whose length prefix promises more bytes than exist
    {
        std::ofstream out(path_, std::ios::binary | std::ios::app);
        const char partial[] = {0x40, 0x0a, 0x02};
        out.write(partial, sizeof(partial));
    }

    JournalLedgerStore reopened(path_);

    EXPECT_EQ(reopened.size(), 1u);
    EXPECT_EQ(std::filesystem::file_size(path_), intact_size);

    auto next = make_event(1, 10, SOLD, -3);
    EXPECT_EQ(reopened.append(next), 2);
}

TEST_F(JournalLedgerStoreTest, Reopen_WithCorruptCompleteRecord_ShouldThrowStorageError) {
    {
        JournalLedgerStore store(path_);
        auto event = make_event(1, 10, RECEIVED, 50);
        store.append(event);
    }

    // Given a complete record of bytes that do not parse
    {
        std::ofstream out(path_, std::ios::binary | std::ios::app);
        const char garbage[] = {0x03, static_cast<char>(0xff), static_cast<char>(0xff), static_cast<char>(0xff)};
        out.write(garbage, sizeof(garbage));
    }

    EXPECT_THROW(JournalLedgerStore reopened(path_), StorageError);
}

TEST_F(JournalLedgerStoreTest, Reopen_WithDamagedPrefixBeforeIntactRecords_ShouldThrowAndKeepFile) {
    std::uintmax_t first_record_end = 0;
    {
        JournalLedgerStore store(path_);
        auto first = make_event(1, 10, RECEIVED, 50);
        store.append(first);
        first_record_end = std::filesystem::file_size(path_);
        auto second = make_event(1, 10, SOLD, -5);
        store.append(second);
        auto third = make_event(1, 10, SOLD, -7);
        store.append(third);
    }
    auto intact_size = std::filesystem::file_size(path_);

    // Given the second record's length prefix overwritten to claim more
    // bytes than the file holds
    {
        std::fstream io(path_, std::ios::binary | std::ios::in | std::ios::out);
        io.seekp(static_cast<std::streamoff>(first_record_end));
        io.put(static_cast<char>(0xff));
    }

    EXPECT_THROW(JournalLedgerStore reopened(path_), StorageError);
    EXPECT_EQ(std::filesystem::file_size(path_), intact_size);
}

// =============================================================================
// Checkpoint File Tests
// =============================================================================

TEST(CheckpointFileTest, Read_WhenFileMissing_ShouldReturnNullopt) {
    auto path = temp_path(".checkpoint");
    EXPECT_FALSE(checkpoint::read(path).has_value());
}

TEST(CheckpointFileTest, WriteThenRead_ShouldPreserveRecords) {
    auto path = temp_path(".checkpoint");
    ProjectionCheckpoint saved;
    saved.set_watermark(42);
    auto* record = saved.add_records();
    *record->mutable_key() = helpers::make_key(1, 10);
    record->set_current_quantity(17);
    record->set_outstanding_reserved(4);
    record->set_last_applied_event_id(42);

    checkpoint::write(path, saved);
    auto loaded = checkpoint::read(path);

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->watermark(), 42);
    ASSERT_EQ(loaded->records_size(), 1);
    EXPECT_EQ(loaded->records(0).current_quantity(), 17);
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
    std::filesystem::remove(path);
}

TEST(CheckpointFileTest, Read_WithGarbage_ShouldThrowStorageError) {
    auto path = temp_path(".checkpoint");
    {
        std::ofstream out(path, std::ios::binary);
        out << "\xff\xff\xff\xff not a checkpoint";
    }
    EXPECT_THROW(checkpoint::read(path), StorageError);
    std::filesystem::remove(path);
}
