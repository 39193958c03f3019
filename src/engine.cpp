#include "stockledger/engine.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/helpers.hpp"
#include "stockledger/logging.hpp"

namespace stockledger {

namespace {

nlohmann::json state_json(const ProjectionState& state) {
    return {{"current_quantity", state.current_quantity},
            {"outstanding_reserved", state.outstanding_reserved},
            {"last_applied_event_id", state.last_applied_event_id}};
}

} // anonymous namespace

InventoryEngine::InventoryEngine(const ReferenceCatalog& catalog,
                                 std::unique_ptr<LedgerStore> store,
                                 EngineOptions options)
    : catalog_(catalog)
    , store_(std::move(store))
    , projector_(*store_, options.version_retention)
    , watermark_(store_->max_event_id())
    , admission_(*store_, projector_, watermark_, locks_, &catalog_)
    , resolver_(catalog_, projector_, watermark_)
    , low_stock_(catalog_, *store_, projector_, options.sales_window_days) {}

InventoryChangeEvent InventoryEngine::submit_change(const ChangeRequest& request) {
    return admission_.submit(request);
}

std::vector<InventoryChangeEvent> InventoryEngine::submit_batch(
    const std::vector<ChangeRequest>& requests) {
    return admission_.submit_batch(requests);
}

int64_t InventoryEngine::get_quantity(const InventoryKey& key) const {
    return projector_.current_quantity(helpers::key_ref(key));
}

ProjectionState InventoryEngine::get_projection(const InventoryKey& key) const {
    return projector_.state(helpers::key_ref(key));
}

BundleAvailability InventoryEngine::get_bundle_availability(int64_t bundle_id,
                                                            int64_t warehouse_id) const {
    return resolver_.resolve(bundle_id, warehouse_id);
}

std::vector<InventoryChangeEvent> InventoryEngine::get_history(const InventoryKey& key,
                                                               int64_t since_event_id) const {
    return store_->read_from(helpers::key_ref(key), since_event_id);
}

bool InventoryEngine::untouched(const KeyRef& key) const {
    return !locks_.find(key) && store_->max_event_id(key) == 0 && projector_.state(key) == ProjectionState{};
}

ReconcileResult InventoryEngine::reconcile(const InventoryKey& key) {
    const auto ref = helpers::key_ref(key);
    if (untouched(ref)) {
        // Never written: nothing to rebuild and nothing to unblock.
        return ReconcileResult{};
    }

    // Long replay runs without the write lock; only the tail appended
    // meanwhile is replayed under it.
    auto rebuilt = projector_.rebuild(ref);

    auto& slot = locks_.slot(ref);
    std::lock_guard<std::mutex> lock(slot.mutex);
    rebuilt = projector_.replay_tail(ref, rebuilt);

    ReconcileResult result;
    result.quantity = rebuilt.current_quantity;
    auto live = projector_.state(ref);
    if (live != rebuilt) {
        result.diverged = true;
        log_warn("engine", "projection_replaced",
                 {{"key", helpers::key_string(ref)}, {"live", state_json(live)},
                  {"rebuilt", state_json(rebuilt)}});
        projector_.install(ref, rebuilt);
    }
    if (slot.blocked) {
        log_info("engine", "key_unblocked", {{"key", helpers::key_string(ref)}});
        slot.blocked = false;
        slot.blocked_reason.clear();
    }
    return result;
}

VerifyResult InventoryEngine::verify(const InventoryKey& key) {
    const auto ref = helpers::key_ref(key);
    if (untouched(ref)) {
        return VerifyResult{};
    }

    VerifyResult result;
    ProjectionState rebuilt;
    std::string mismatch;
    auto check = [&](const std::vector<InventoryChangeEvent>& events) {
        for (const auto& event : events) {
            rebuilt = QuantityProjector::apply_delta(rebuilt, event);
            ++result.events_checked;
            if (mismatch.empty() && event.quantity_after() != rebuilt.current_quantity) {
                mismatch = "event " + std::to_string(event.event_id()) + " recorded quantity_after " +
                           std::to_string(event.quantity_after()) + " but replay gives " +
                           std::to_string(rebuilt.current_quantity);
            }
        }
    };

    check(store_->read_range(ref, 0, store_->max_event_id(ref)));

    auto& slot = locks_.slot(ref);
    std::lock_guard<std::mutex> lock(slot.mutex);
    check(store_->read_from(ref, rebuilt.last_applied_event_id));

    auto live = projector_.state(ref);
    if (mismatch.empty() && live != rebuilt) {
        mismatch = "live projection quantity " + std::to_string(live.current_quantity) +
                   " (event " + std::to_string(live.last_applied_event_id) +
                   ") differs from rebuilt " + std::to_string(rebuilt.current_quantity) +
                   " (event " + std::to_string(rebuilt.last_applied_event_id) + ")";
    }
    if (!mismatch.empty()) {
        slot.blocked = true;
        slot.blocked_reason = mismatch;
        log_error("engine", "projection_divergence",
                  {{"key", helpers::key_string(ref)}, {"detail", mismatch},
                   {"live", state_json(live)}, {"rebuilt", state_json(rebuilt)}});
        throw ProjectionDivergenceError(helpers::key_string(ref) + ": " + mismatch);
    }

    result.quantity = rebuilt.current_quantity;
    return result;
}

bool InventoryEngine::is_blocked(const InventoryKey& key) {
    auto* slot = locks_.find(helpers::key_ref(key));
    if (!slot) return false;
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->blocked;
}

int64_t InventoryEngine::recover() {
    int64_t replayed = 0;
    for (const auto& key : store_->keys()) {
        auto& slot = locks_.slot(key);
        std::lock_guard<std::mutex> lock(slot.mutex);
        replayed += projector_.catch_up(key);
    }
    watermark_.reset(store_->max_event_id());
    log_info("engine", "recovery_complete",
             {{"events_replayed", replayed}, {"keys", store_->keys().size()},
              {"watermark", watermark_.watermark()}});
    return replayed;
}

ProjectionCheckpoint InventoryEngine::checkpoint() const {
    return projector_.checkpoint();
}

void InventoryEngine::restore(const ProjectionCheckpoint& checkpoint) {
    projector_.restore(checkpoint);
    log_info("engine", "checkpoint_restored",
             {{"records", checkpoint.records_size()}, {"watermark", checkpoint.watermark()}});
}

std::vector<LowStockAlert> InventoryEngine::low_stock_alerts(
    int64_t company_id, const google::protobuf::Timestamp& now) const {
    return low_stock_.alerts(company_id, now);
}

} // namespace stockledger
