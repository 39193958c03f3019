#include "stockledger/admission.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/helpers.hpp"
#include "stockledger/logging.hpp"
#include "stockledger/validation.hpp"

#include <algorithm>
#include <map>

namespace stockledger {

namespace {

void log_rejection(const RejectedChangeError& e) {
    const auto& r = e.rejection();
    log_warn("admission", "change_rejected",
             {{"rule", r.rule()},
              {"key", helpers::key_string(r.key())},
              {"change_type", helpers::change_type_name(r.change_type())},
              {"attempted_delta", r.attempted_delta()},
              {"current_quantity", r.current_quantity()},
              {"outstanding_reserved", r.outstanding_reserved()}});
}

} // anonymous namespace

AdmissionController::AdmissionController(LedgerStore& store, QuantityProjector& projector,
                                         CommitWatermark& watermark, KeyLockTable& locks,
                                         const ReferenceCatalog* catalog)
    : store_(store)
    , projector_(projector)
    , watermark_(watermark)
    , locks_(locks)
    , catalog_(catalog) {}

void AdmissionController::check_reference(const ChangeRequest& request) const {
    if (catalog_) {
        validation::require_stockable(request, *catalog_);
    }
}

void AdmissionController::require_writable(const KeyRef& key, const KeyLockTable::Slot& slot) {
    if (slot.blocked) {
        throw ProjectionDivergenceError("writes to " + helpers::key_string(key) +
                                        " are blocked until reconciled: " + slot.blocked_reason);
    }
}

// Caller holds the key's slot lock.
ProjectionState AdmissionController::caught_up_state(const KeyRef& key) {
    if (projector_.state(key).last_applied_event_id < store_.max_event_id(key)) {
        auto replayed = projector_.catch_up(key);
        log_info("admission", "projection_caught_up",
                 {{"key", helpers::key_string(key)}, {"events_replayed", replayed}});
    }
    return projector_.state(key);
}

InventoryChangeEvent AdmissionController::to_event(const ChangeRequest& request,
                                                   int64_t quantity_after) {
    InventoryChangeEvent event;
    *event.mutable_key() = request.key();
    event.set_change_type(request.change_type());
    event.set_quantity_delta(request.quantity_delta());
    event.set_reference(request.reference());
    *event.mutable_occurred_at() = request.has_occurred_at() ? request.occurred_at() : helpers::now();
    event.set_quantity_after(quantity_after);
    return event;
}

std::vector<InventoryChangeEvent> AdmissionController::commit(std::vector<InventoryChangeEvent> events) {
    auto ids = store_.append_batch(events);
    CommitGuard guard(watermark_, ids);
    for (const auto& event : events) {
        projector_.apply(event);
    }
    for (const auto& event : events) {
        log_info("admission", "change_admitted",
                 {{"event_id", event.event_id()},
                  {"key", helpers::key_string(event.key())},
                  {"change_type", helpers::change_type_name(event.change_type())},
                  {"quantity_delta", event.quantity_delta()},
                  {"quantity_after", event.quantity_after()},
                  {"reference", event.reference()}});
    }
    return events;
}

InventoryChangeEvent AdmissionController::submit(const ChangeRequest& request) {
    try {
        validation::require_well_formed(request);
        check_reference(request);

        const auto key = helpers::key_ref(request.key());
        auto& slot = locks_.slot(key);
        std::lock_guard<std::mutex> lock(slot.mutex);
        require_writable(key, slot);

        auto state = caught_up_state(key);
        validation::require_sufficient(request, state);

        auto events = commit({to_event(request, state.current_quantity + request.quantity_delta())});
        return events.front();
    } catch (const RejectedChangeError& e) {
        log_rejection(e);
        throw;
    }
}

std::vector<InventoryChangeEvent> AdmissionController::submit_batch(
    const std::vector<ChangeRequest>& requests) {
    try {
        if (requests.empty()) {
            throw ValidationError(validation::make_rejection(
                rules::EMPTY_BATCH, ChangeRequest{}, ProjectionState{}, "batch has no changes"));
        }
        for (const auto& request : requests) {
            validation::require_well_formed(request);
            check_reference(request);
        }

        std::vector<KeyRef> keys;
        for (const auto& request : requests) {
            keys.push_back(helpers::key_ref(request.key()));
        }
        std::sort(keys.begin(), keys.end());
        keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

        auto locks = locks_.lock_all(keys);
        std::map<KeyRef, ProjectionState> pending;
        for (const auto& key : keys) {
            require_writable(key, locks_.slot(key));
            pending[key] = caught_up_state(key);
        }

        std::vector<InventoryChangeEvent> events;
        events.reserve(requests.size());
        for (const auto& request : requests) {
            auto& state = pending[helpers::key_ref(request.key())];
            validation::require_sufficient(request, state);

            auto event = to_event(request, state.current_quantity + request.quantity_delta());
            // Ids are not assigned yet; keep the simulated state's id unchanged.
            int64_t last_id = state.last_applied_event_id;
            state = QuantityProjector::apply_delta(state, event);
            state.last_applied_event_id = last_id;
            events.push_back(std::move(event));
        }

        return commit(std::move(events));
    } catch (const RejectedChangeError& e) {
        log_rejection(e);
        throw;
    }
}

} // namespace stockledger
