#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>
#include "stockledger/ledger.pb.h"
#include "helpers.hpp"
#include "ledger_store.hpp"

namespace stockledger {

/**
 * Current-quantity projection of one inventory key.
 */
struct ProjectionState {
    int64_t current_quantity = 0;
    // Units reserved and not yet released.
    int64_t outstanding_reserved = 0;
    int64_t last_applied_event_id = 0;

    bool operator==(const ProjectionState& other) const {
        return current_quantity == other.current_quantity &&
               outstanding_reserved == other.outstanding_reserved &&
               last_applied_event_id == other.last_applied_event_id;
    }
    bool operator!=(const ProjectionState& other) const { return !(*this == other); }
};

/**
 * Maintains the current-quantity snapshot of every key from the ledger.
 *
 * The projection is a rebuildable cache: incremental apply() and full
 * rebuild() share one transition function, so replaying the same events
 * in event_id order always yields the same state.
 *
 * Each key also keeps its most recent (event_id, quantity) versions so
 * readers can ask for the quantity as of a pinned event id.
 */
class QuantityProjector {
public:
    static constexpr size_t kDefaultVersionRetention = 256;

    explicit QuantityProjector(const LedgerStore& store,
                               size_t version_retention = kDefaultVersionRetention);

    /**
     * Transition function shared by apply and rebuild.
     */
    static ProjectionState apply_delta(ProjectionState state, const InventoryChangeEvent& event);

    /**
     * Fold events (in event_id order) onto a starting state.
     */
    static ProjectionState replay(const std::vector<InventoryChangeEvent>& events,
                                  ProjectionState from = {});

    int64_t current_quantity(const KeyRef& key) const;

    ProjectionState state(const KeyRef& key) const;

    /**
     * Apply one admitted event. Idempotent by event_id: an event at or
     * below the key's last applied id is ignored.
     *
     * @return true if the event changed the projection
     */
    bool apply(const InventoryChangeEvent& event);

    /**
     * Replay the key's full ledger history from zero. Does not modify the
     * live projection; last_applied_event_id of the result is the
     * boundary the replay stopped at.
     */
    ProjectionState rebuild(const KeyRef& key) const;

    /**
     * Continue a rebuilt state with the events appended after its
     * boundary.
     */
    ProjectionState replay_tail(const KeyRef& key, const ProjectionState& rebuilt) const;

    /**
     * Apply every ledger event for the key past its last applied id.
     *
     * @return number of events applied
     */
    int64_t catch_up(const KeyRef& key);

    /**
     * Quantity of the key as of a committed event id.
     *
     * @throws SnapshotUnavailableError if the versions needed were discarded
     */
    int64_t quantity_at(const KeyRef& key, int64_t as_of_event_id) const;

    /**
     * Replace a key's live projection (reconciliation, checkpoint restore).
     * Versions older than the installed state become unavailable.
     */
    void install(const KeyRef& key, const ProjectionState& state);

    ProjectionCheckpoint checkpoint() const;

    /**
     * Install every record of a checkpoint.
     *
     * @throws StorageError if a record is ahead of the ledger
     */
    void restore(const ProjectionCheckpoint& checkpoint);

    std::vector<KeyRef> keys() const;

    size_t version_retention() const { return version_retention_; }

private:
    struct Entry {
        mutable std::mutex mutex;
        ProjectionState state;
        std::deque<std::pair<int64_t, int64_t>> versions;
        // True once versions no longer reach back to the first event.
        bool truncated = false;
    };

    Entry* find(const KeyRef& key) const;
    Entry& find_or_create(const KeyRef& key);
    void record_version(Entry& entry);

    const LedgerStore& store_;
    size_t version_retention_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<KeyRef, std::unique_ptr<Entry>, KeyRefHash> entries_;
};

} // namespace stockledger
