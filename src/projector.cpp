#include "stockledger/projector.hpp"
#include "stockledger/errors.hpp"

#include <algorithm>

namespace stockledger {

QuantityProjector::QuantityProjector(const LedgerStore& store, size_t version_retention)
    : store_(store), version_retention_(std::max<size_t>(version_retention, 1)) {}

ProjectionState QuantityProjector::apply_delta(ProjectionState state,
                                               const InventoryChangeEvent& event) {
    state.current_quantity += event.quantity_delta();
    switch (event.change_type()) {
        case RESERVED:   // negative delta, reservation grows
        case RELEASED:   // positive delta, reservation shrinks
            state.outstanding_reserved -= event.quantity_delta();
            break;
        default:
            break;
    }
    state.last_applied_event_id = event.event_id();
    return state;
}

ProjectionState QuantityProjector::replay(const std::vector<InventoryChangeEvent>& events,
                                          ProjectionState from) {
    for (const auto& event : events) {
        if (event.event_id() <= from.last_applied_event_id) continue;
        from = apply_delta(from, event);
    }
    return from;
}

QuantityProjector::Entry* QuantityProjector::find(const KeyRef& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : it->second.get();
}

QuantityProjector::Entry& QuantityProjector::find_or_create(const KeyRef& key) {
    if (auto* entry = find(key)) return *entry;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& entry = entries_[key];
    if (!entry) {
        entry = std::make_unique<Entry>();
    }
    return *entry;
}

void QuantityProjector::record_version(Entry& entry) {
    entry.versions.emplace_back(entry.state.last_applied_event_id, entry.state.current_quantity);
    while (entry.versions.size() > version_retention_) {
        entry.versions.pop_front();
        entry.truncated = true;
    }
}

int64_t QuantityProjector::current_quantity(const KeyRef& key) const {
    return state(key).current_quantity;
}

ProjectionState QuantityProjector::state(const KeyRef& key) const {
    const Entry* entry = find(key);
    if (!entry) return {};
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->state;
}

bool QuantityProjector::apply(const InventoryChangeEvent& event) {
    Entry& entry = find_or_create(helpers::key_ref(event.key()));
    std::lock_guard<std::mutex> lock(entry.mutex);
    if (event.event_id() <= entry.state.last_applied_event_id) {
        return false;
    }
    entry.state = apply_delta(entry.state, event);
    record_version(entry);
    return true;
}

ProjectionState QuantityProjector::rebuild(const KeyRef& key) const {
    int64_t boundary = store_.max_event_id(key);
    return replay(store_.read_range(key, 0, boundary));
}

ProjectionState QuantityProjector::replay_tail(const KeyRef& key,
                                               const ProjectionState& rebuilt) const {
    return replay(store_.read_from(key, rebuilt.last_applied_event_id), rebuilt);
}

int64_t QuantityProjector::catch_up(const KeyRef& key) {
    int64_t applied = 0;
    auto since = state(key).last_applied_event_id;
    for (const auto& event : store_.read_from(key, since)) {
        if (apply(event)) ++applied;
    }
    return applied;
}

int64_t QuantityProjector::quantity_at(const KeyRef& key, int64_t as_of_event_id) const {
    const Entry* entry = find(key);
    if (!entry) return 0;

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->state.last_applied_event_id <= as_of_event_id) {
        return entry->state.current_quantity;
    }
    for (auto it = entry->versions.rbegin(); it != entry->versions.rend(); ++it) {
        if (it->first <= as_of_event_id) {
            return it->second;
        }
    }
    if (!entry->truncated) {
        // Every version is newer than the pin: the key had no events yet.
        return 0;
    }
    throw SnapshotUnavailableError(
        "quantity of " + helpers::key_string(key) + " as of event " +
        std::to_string(as_of_event_id) + " is no longer retained");
}

void QuantityProjector::install(const KeyRef& key, const ProjectionState& state) {
    Entry& entry = find_or_create(key);
    std::lock_guard<std::mutex> lock(entry.mutex);
    entry.state = state;
    entry.versions.clear();
    entry.versions.emplace_back(state.last_applied_event_id, state.current_quantity);
    entry.truncated = state.last_applied_event_id > 0;
}

ProjectionCheckpoint QuantityProjector::checkpoint() const {
    ProjectionCheckpoint checkpoint;
    int64_t watermark = 0;
    for (const auto& key : keys()) {
        auto current = state(key);
        auto* record = checkpoint.add_records();
        *record->mutable_key() = helpers::to_proto(key);
        record->set_current_quantity(current.current_quantity);
        record->set_outstanding_reserved(current.outstanding_reserved);
        record->set_last_applied_event_id(current.last_applied_event_id);
        watermark = std::max(watermark, current.last_applied_event_id);
    }
    checkpoint.set_watermark(watermark);
    *checkpoint.mutable_written_at() = helpers::now();
    return checkpoint;
}

void QuantityProjector::restore(const ProjectionCheckpoint& checkpoint) {
    for (const auto& record : checkpoint.records()) {
        auto key = helpers::key_ref(record.key());
        if (record.last_applied_event_id() > store_.max_event_id(key)) {
            throw StorageError("checkpoint for " + helpers::key_string(key) +
                               " is ahead of the ledger (event " +
                               std::to_string(record.last_applied_event_id()) + ")");
        }
        ProjectionState restored;
        restored.current_quantity = record.current_quantity();
        restored.outstanding_reserved = record.outstanding_reserved();
        restored.last_applied_event_id = record.last_applied_event_id();
        install(key, restored);
    }
}

std::vector<KeyRef> QuantityProjector::keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<KeyRef> result;
    result.reserve(entries_.size());
    for (const auto& [key, _] : entries_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace stockledger
