#include "stockledger/ledger_store.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/logging.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/delimited_message_util.h>

namespace stockledger {

namespace {

/**
 * True if tail[start..] is one or more whole journal records, with event
 * ids increasing past last_event_id, ending exactly at end of file.
 */
bool records_follow(const std::string& tail, size_t start, int64_t last_event_id) {
    google::protobuf::io::ArrayInputStream input(tail.data() + start,
                                                 static_cast<int>(tail.size() - start));
    size_t parsed = 0;
    while (true) {
        JournalRecord record;
        bool clean_eof = false;
        if (!google::protobuf::util::ParseDelimitedFromZeroCopyStream(&record, &input, &clean_eof)) {
            return clean_eof && parsed > 0;
        }
        if (record.events_size() == 0) return false;
        for (const auto& event : record.events()) {
            if (!event.has_key() || event.event_id() <= last_event_id) return false;
            last_event_id = event.event_id();
        }
        ++parsed;
    }
}

/**
 * True if the bytes from offset to end of file are a single record cut
 * short: an incomplete length prefix, or a prefix longer than what follows
 * with no whole record after it. A damaged prefix in front of intact
 * records is corruption, not a torn write.
 */
bool is_torn_tail(const std::string& path, int64_t offset, int64_t last_event_id) {
    std::ifstream in(path, std::ios::binary);
    in.seekg(offset);
    std::string tail((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    google::protobuf::io::ArrayInputStream input(tail.data(), static_cast<int>(tail.size()));
    google::protobuf::io::CodedInputStream coded(&input);
    uint32_t length = 0;
    if (!coded.ReadVarint32(&length)) return true;
    auto remaining = static_cast<int64_t>(tail.size()) - coded.CurrentPosition();
    if (static_cast<int64_t>(length) <= remaining) return false;

    for (size_t start = 1; start < tail.size(); ++start) {
        if (records_follow(tail, start, last_event_id)) return false;
    }
    return true;
}

std::vector<InventoryChangeEvent>::const_iterator first_after(
    const std::vector<InventoryChangeEvent>& events, int64_t event_id) {
    return std::upper_bound(events.begin(), events.end(), event_id,
        [](int64_t id, const InventoryChangeEvent& e) { return id < e.event_id(); });
}

} // anonymous namespace

// =============================================================================
// InMemoryLedgerStore
// =============================================================================

int64_t InMemoryLedgerStore::append(InventoryChangeEvent& event) {
    std::vector<InventoryChangeEvent> batch{event};
    auto ids = append_batch(batch);
    event.set_event_id(ids.front());
    return ids.front();
}

std::vector<int64_t> InMemoryLedgerStore::append_batch(std::vector<InventoryChangeEvent>& events) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::vector<int64_t> ids;
    ids.reserve(events.size());
    int64_t next = last_event_id_;
    for (auto& event : events) {
        event.set_event_id(++next);
        ids.push_back(next);
    }

    // Nothing is visible until persist succeeds.
    persist(events);

    for (const auto& event : events) {
        events_[helpers::key_ref(event.key())].push_back(event);
    }
    last_event_id_ = next;
    size_ += events.size();
    return ids;
}

void InMemoryLedgerStore::load(InventoryChangeEvent event) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (event.event_id() <= last_event_id_) {
        throw StorageError("ledger event ids must strictly increase: got " +
                           std::to_string(event.event_id()) + " after " +
                           std::to_string(last_event_id_));
    }
    last_event_id_ = event.event_id();
    events_[helpers::key_ref(event.key())].push_back(std::move(event));
    ++size_;
}

std::vector<InventoryChangeEvent> InMemoryLedgerStore::read_from(const KeyRef& key,
                                                                 int64_t since_event_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = events_.find(key);
    if (it == events_.end()) return {};
    return {first_after(it->second, since_event_id), it->second.end()};
}

std::vector<InventoryChangeEvent> InMemoryLedgerStore::read_range(const KeyRef& key,
                                                                  int64_t since_event_id,
                                                                  int64_t until_event_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = events_.find(key);
    if (it == events_.end() || until_event_id <= since_event_id) return {};
    auto begin = first_after(it->second, since_event_id);
    auto end = first_after(it->second, until_event_id);
    return {begin, end};
}

int64_t InMemoryLedgerStore::max_event_id(const KeyRef& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = events_.find(key);
    if (it == events_.end() || it->second.empty()) return 0;
    return it->second.back().event_id();
}

int64_t InMemoryLedgerStore::max_event_id() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_event_id_;
}

std::vector<KeyRef> InMemoryLedgerStore::keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<KeyRef> result;
    result.reserve(events_.size());
    for (const auto& [key, _] : events_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t InMemoryLedgerStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return size_;
}

// =============================================================================
// JournalLedgerStore
// =============================================================================

JournalLedgerStore::JournalLedgerStore(const std::string& path)
    : path_(path) {
    load_journal();

    out_.open(path_, std::ios::binary | std::ios::app);
    if (!out_) {
        throw StorageError("cannot open ledger journal for append: " + path_);
    }
    log_info("ledger", "journal_opened",
             {{"path", path_}, {"records", records_loaded_}, {"events", size()}});
}

void JournalLedgerStore::load_journal() {
    if (!std::filesystem::exists(path_)) return;

    int64_t good_bytes = 0;
    bool torn = false;
    {
        std::ifstream in(path_, std::ios::binary);
        if (!in) {
            throw StorageError("cannot open ledger journal: " + path_);
        }
        google::protobuf::io::IstreamInputStream input(&in);

        while (true) {
            JournalRecord record;
            bool clean_eof = false;
            if (!google::protobuf::util::ParseDelimitedFromZeroCopyStream(&record, &input, &clean_eof)) {
                torn = !clean_eof;
                break;
            }
            for (auto& event : *record.mutable_events()) {
                load(std::move(event));
            }
            ++records_loaded_;
            good_bytes = input.ByteCount();
        }
    }

    if (torn) {
        if (!is_torn_tail(path_, good_bytes, max_event_id())) {
            throw StorageError("corrupt ledger journal record at byte " +
                               std::to_string(good_bytes) + " in " + path_);
        }
        auto file_size = static_cast<int64_t>(std::filesystem::file_size(path_));
        log_warn("ledger", "journal_torn_record_truncated",
                 {{"path", path_}, {"kept_bytes", good_bytes},
                  {"dropped_bytes", file_size - good_bytes}});
        std::error_code ec;
        std::filesystem::resize_file(path_, static_cast<uintmax_t>(good_bytes), ec);
        if (ec) {
            throw StorageError("cannot truncate torn ledger journal " + path_ + ": " + ec.message());
        }
    }
}

void JournalLedgerStore::persist(const std::vector<InventoryChangeEvent>& events) {
    JournalRecord record;
    for (const auto& event : events) {
        *record.add_events() = event;
    }
    if (!google::protobuf::util::SerializeDelimitedToOstream(record, &out_)) {
        throw StorageError("failed to serialize journal record to " + path_);
    }
    out_.flush();
    if (!out_) {
        throw StorageError("failed to write ledger journal " + path_);
    }
}

} // namespace stockledger
