#pragma once

#include <cstdint>
#include <memory>
#include <vector>
#include <google/protobuf/timestamp.pb.h>
#include "stockledger/ledger.pb.h"
#include "admission.hpp"
#include "bundle_resolver.hpp"
#include "catalog.hpp"
#include "commit_watermark.hpp"
#include "key_lock_table.hpp"
#include "ledger_store.hpp"
#include "low_stock.hpp"
#include "projector.hpp"

namespace stockledger {

struct EngineOptions {
    size_t version_retention = QuantityProjector::kDefaultVersionRetention;
    int sales_window_days = LowStockReporter::kDefaultSalesWindowDays;
};

struct ReconcileResult {
    int64_t quantity = 0;
    // True if the live projection disagreed with the ledger and was replaced.
    bool diverged = false;
};

struct VerifyResult {
    int64_t quantity = 0;
    int64_t events_checked = 0;
};

/**
 * Inventory ledger and bundle availability engine.
 *
 * Entry point for callers such as order processing, receiving and admin
 * tooling. Owns the ledger store, the quantity projection and the write
 * serialization; reads the catalog it is given.
 *
 * Example:
 *   InventoryEngine engine(catalog, std::make_unique<InMemoryLedgerStore>());
 *   engine.submit_change(helpers::make_change(1, 10, RECEIVED, 100));
 *   auto on_hand = engine.get_quantity(helpers::make_key(1, 10));
 */
class InventoryEngine {
public:
    InventoryEngine(const ReferenceCatalog& catalog, std::unique_ptr<LedgerStore> store,
                    EngineOptions options = {});

    InventoryChangeEvent submit_change(const ChangeRequest& request);

    std::vector<InventoryChangeEvent> submit_batch(const std::vector<ChangeRequest>& requests);

    int64_t get_quantity(const InventoryKey& key) const;

    ProjectionState get_projection(const InventoryKey& key) const;

    BundleAvailability get_bundle_availability(int64_t bundle_id, int64_t warehouse_id) const;

    /**
     * Events for the key with event_id > since_event_id.
     */
    std::vector<InventoryChangeEvent> get_history(const InventoryKey& key,
                                                  int64_t since_event_id = 0) const;

    /**
     * Rebuild the key from its full history and install the result,
     * unblocking the key if it was blocked.
     */
    ReconcileResult reconcile(const InventoryKey& key);

    /**
     * Rebuild the key and compare it with the live projection and with
     * every event's recorded quantity_after.
     *
     * @throws ProjectionDivergenceError on mismatch; the key is then
     *         blocked for writes until reconciled
     */
    VerifyResult verify(const InventoryKey& key);

    bool is_blocked(const InventoryKey& key);

    /**
     * Replay every ledger event the projection has not applied yet.
     *
     * @return number of events replayed
     */
    int64_t recover();

    ProjectionCheckpoint checkpoint() const;

    /**
     * Install a checkpoint. Call recover() afterwards to replay the gap.
     */
    void restore(const ProjectionCheckpoint& checkpoint);

    std::vector<LowStockAlert> low_stock_alerts(int64_t company_id,
                                                const google::protobuf::Timestamp& now) const;

    const LedgerStore& store() const { return *store_; }
    QuantityProjector& projector() { return projector_; }
    const KeyLockTable& locks() const { return locks_; }
    int64_t watermark() const { return watermark_.watermark(); }

private:
    // No slot, no ledger events and an empty projection.
    bool untouched(const KeyRef& key) const;

    const ReferenceCatalog& catalog_;
    std::unique_ptr<LedgerStore> store_;
    QuantityProjector projector_;
    CommitWatermark watermark_;
    KeyLockTable locks_;
    AdmissionController admission_;
    BundleResolver resolver_;
    LowStockReporter low_stock_;
};

} // namespace stockledger
