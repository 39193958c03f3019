#pragma once

#include <vector>
#include "stockledger/ledger.pb.h"
#include "catalog.hpp"
#include "commit_watermark.hpp"
#include "key_lock_table.hpp"
#include "ledger_store.hpp"
#include "projector.hpp"

namespace stockledger {

/**
 * Validates change requests and admits them to the ledger.
 *
 * For each key, check-then-append-then-apply runs under the key's slot
 * lock, so two writers on one key can never both pass a stock check
 * only one of them can satisfy. Distinct keys proceed in parallel.
 * A key whose projection lags the ledger is replayed forward before
 * its first check.
 */
class AdmissionController {
public:
    /**
     * @param catalog Reference catalog for product/warehouse checks, or
     *                nullptr to skip them
     */
    AdmissionController(LedgerStore& store, QuantityProjector& projector,
                        CommitWatermark& watermark, KeyLockTable& locks,
                        const ReferenceCatalog* catalog = nullptr);

    /**
     * Validate and admit one change.
     *
     * @return the admitted event, with event_id and quantity_after set
     * @throws ValidationError, InsufficientStockError, OverReleaseError,
     *         UnknownReferenceError, ProjectionDivergenceError, StorageError
     */
    InventoryChangeEvent submit(const ChangeRequest& request);

    /**
     * Admit several changes all-or-nothing. Requests on the same key are
     * checked in order, each against the state left by the previous ones.
     */
    std::vector<InventoryChangeEvent> submit_batch(const std::vector<ChangeRequest>& requests);

private:
    void check_reference(const ChangeRequest& request) const;
    static void require_writable(const KeyRef& key, const KeyLockTable::Slot& slot);
    ProjectionState caught_up_state(const KeyRef& key);
    static InventoryChangeEvent to_event(const ChangeRequest& request, int64_t quantity_after);
    std::vector<InventoryChangeEvent> commit(std::vector<InventoryChangeEvent> events);

    LedgerStore& store_;
    QuantityProjector& projector_;
    CommitWatermark& watermark_;
    KeyLockTable& locks_;
    const ReferenceCatalog* catalog_;
};

} // namespace stockledger
