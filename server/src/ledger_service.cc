#include "ledger_service.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/helpers.hpp"
#include "stockledger/logging.hpp"
#include <grpcpp/grpcpp.h>
#include <vector>

namespace stockledger {
namespace server {

namespace {

grpc::Status missing_key() {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "inventory key is required");
}

/**
 * Run a handler, mapping engine errors to their gRPC status.
 */
template<typename Fn>
grpc::Status guarded(const char* rpc, Fn&& fn) {
    try {
        fn();
        return grpc::Status::OK;
    } catch (const LedgerError& e) {
        if (e.is_fatal()) {
            log_error("service", "rpc_failed", {{"rpc", rpc}, {"rule", e.rule()}, {"error", e.what()}});
        }
        return e.to_grpc_status();
    } catch (const std::exception& e) {
        log_error("service", "rpc_internal_error", {{"rpc", rpc}, {"error", e.what()}});
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

} // anonymous namespace

class LedgerService final : public InventoryLedger::Service {
public:
    explicit LedgerService(InventoryEngine& engine) : engine_(engine) {}

    grpc::Status SubmitChange(grpc::ServerContext* context,
                              const SubmitChangeRequest* request,
                              SubmitChangeResponse* response) override {
        if (!request->has_change()) {
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "change is required");
        }
        return guarded("SubmitChange", [&] {
            *response->mutable_event() = engine_.submit_change(request->change());
        });
    }

    grpc::Status SubmitBatch(grpc::ServerContext* context,
                             const SubmitBatchRequest* request,
                             SubmitBatchResponse* response) override {
        return guarded("SubmitBatch", [&] {
            std::vector<ChangeRequest> changes(request->changes().begin(), request->changes().end());
            for (auto& event : engine_.submit_batch(changes)) {
                *response->add_events() = std::move(event);
            }
        });
    }

    grpc::Status GetQuantity(grpc::ServerContext* context,
                             const GetQuantityRequest* request,
                             GetQuantityResponse* response) override {
        if (!request->has_key()) return missing_key();
        return guarded("GetQuantity", [&] {
            auto state = engine_.get_projection(request->key());
            *response->mutable_key() = request->key();
            response->set_quantity(state.current_quantity);
            response->set_outstanding_reserved(state.outstanding_reserved);
            response->set_last_applied_event_id(state.last_applied_event_id);
        });
    }

    grpc::Status GetBundleAvailability(grpc::ServerContext* context,
                                       const GetBundleAvailabilityRequest* request,
                                       GetBundleAvailabilityResponse* response) override {
        return guarded("GetBundleAvailability", [&] {
            auto result = engine_.get_bundle_availability(request->bundle_id(), request->warehouse_id());
            response->set_bundle_id(result.product_id);
            response->set_warehouse_id(result.warehouse_id);
            response->set_availability(result.availability);
            response->set_as_of_event_id(result.as_of_event_id);
        });
    }

    grpc::Status GetHistory(grpc::ServerContext* context,
                            const GetHistoryRequest* request,
                            GetHistoryResponse* response) override {
        if (!request->has_key()) return missing_key();
        return guarded("GetHistory", [&] {
            for (auto& event : engine_.get_history(request->key(), request->since_event_id())) {
                *response->add_events() = std::move(event);
            }
        });
    }

    grpc::Status Reconcile(grpc::ServerContext* context,
                           const ReconcileRequest* request,
                           ReconcileResponse* response) override {
        if (!request->has_key()) return missing_key();
        return guarded("Reconcile", [&] {
            auto result = engine_.reconcile(request->key());
            response->set_quantity(result.quantity);
            response->set_diverged(result.diverged);
            log_info("service", "reconciled",
                     {{"key", helpers::key_string(request->key())},
                      {"quantity", result.quantity}, {"diverged", result.diverged}});
        });
    }

    grpc::Status Verify(grpc::ServerContext* context,
                        const VerifyRequest* request,
                        VerifyResponse* response) override {
        if (!request->has_key()) return missing_key();
        return guarded("Verify", [&] {
            auto result = engine_.verify(request->key());
            response->set_quantity(result.quantity);
            response->set_events_checked(result.events_checked);
        });
    }

    grpc::Status GetLowStockAlerts(grpc::ServerContext* context,
                                   const GetLowStockAlertsRequest* request,
                                   GetLowStockAlertsResponse* response) override {
        return guarded("GetLowStockAlerts", [&] {
            auto alerts = engine_.low_stock_alerts(request->company_id(), helpers::now());
            for (auto& alert : alerts) {
                *response->add_alerts() = std::move(alert);
            }
            response->set_total_alerts(response->alerts_size());
        });
    }

private:
    InventoryEngine& engine_;
};

std::unique_ptr<InventoryLedger::Service> create_ledger_service(InventoryEngine& engine) {
    return std::make_unique<LedgerService>(engine);
}

} // namespace server
} // namespace stockledger
