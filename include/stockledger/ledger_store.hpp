#pragma once

#include <cstdint>
#include <fstream>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "stockledger/ledger.pb.h"
#include "helpers.hpp"

namespace stockledger {

/**
 * Append-only sequence of inventory change events keyed by
 * (warehouse, product).
 *
 * Event ids are global and strictly increasing from 1. Events are never
 * mutated or removed, including after the referenced product or warehouse
 * has been retired from the catalog.
 */
class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    /**
     * Assign the next event id to the event, store it durably and
     * return the id.
     *
     * @throws StorageError if the event could not be stored
     */
    virtual int64_t append(InventoryChangeEvent& event) = 0;

    /**
     * Store several events as one unit: either all of them are stored with
     * consecutive ids (written back into the events) or none are.
     *
     * @throws StorageError if the events could not be stored
     */
    virtual std::vector<int64_t> append_batch(std::vector<InventoryChangeEvent>& events) = 0;

    /**
     * Events for the key with event_id > since_event_id, in id order.
     */
    virtual std::vector<InventoryChangeEvent> read_from(const KeyRef& key,
                                                        int64_t since_event_id) const = 0;

    /**
     * Events for the key with since_event_id < event_id <= until_event_id.
     */
    virtual std::vector<InventoryChangeEvent> read_range(const KeyRef& key,
                                                         int64_t since_event_id,
                                                         int64_t until_event_id) const = 0;

    /**
     * Highest event id stored for the key, 0 if none.
     */
    virtual int64_t max_event_id(const KeyRef& key) const = 0;

    /**
     * Highest event id stored for any key, 0 if the ledger is empty.
     */
    virtual int64_t max_event_id() const = 0;

    /**
     * Every key with at least one event.
     */
    virtual std::vector<KeyRef> keys() const = 0;

    /**
     * Total number of events.
     */
    virtual size_t size() const = 0;
};

/**
 * Ledger held in memory. Used directly for tests and ephemeral servers,
 * and as the index behind JournalLedgerStore.
 */
class InMemoryLedgerStore : public LedgerStore {
public:
    InMemoryLedgerStore() = default;

    int64_t append(InventoryChangeEvent& event) override;
    std::vector<int64_t> append_batch(std::vector<InventoryChangeEvent>& events) override;

    std::vector<InventoryChangeEvent> read_from(const KeyRef& key,
                                                int64_t since_event_id) const override;
    std::vector<InventoryChangeEvent> read_range(const KeyRef& key,
                                                 int64_t since_event_id,
                                                 int64_t until_event_id) const override;

    int64_t max_event_id(const KeyRef& key) const override;
    int64_t max_event_id() const override;
    std::vector<KeyRef> keys() const override;
    size_t size() const override;

protected:
    /**
     * Called with ids assigned, before the events become visible.
     * Throwing aborts the append.
     */
    virtual void persist(const std::vector<InventoryChangeEvent>& events) { (void)events; }

    /**
     * Insert an already-numbered event while loading durable storage.
     */
    void load(InventoryChangeEvent event);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<KeyRef, std::vector<InventoryChangeEvent>, KeyRefHash> events_;
    int64_t last_event_id_ = 0;
    size_t size_ = 0;
};

/**
 * Ledger backed by an append-only journal file of length-delimited
 * JournalRecord messages. Every append is flushed before it returns.
 *
 * Opening an existing journal reloads it. A torn final record left by a
 * crash is truncated away; any other corruption is a StorageError.
 */
class JournalLedgerStore : public InMemoryLedgerStore {
public:
    /**
     * @throws StorageError if the journal cannot be opened or is corrupt
     */
    explicit JournalLedgerStore(const std::string& path);

    const std::string& path() const { return path_; }

    /**
     * Number of records recovered when the journal was opened.
     */
    size_t records_loaded() const { return records_loaded_; }

protected:
    void persist(const std::vector<InventoryChangeEvent>& events) override;

private:
    void load_journal();

    std::string path_;
    std::ofstream out_;
    size_t records_loaded_ = 0;
};

} // namespace stockledger
