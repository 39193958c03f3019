#pragma once

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>
#include <grpcpp/grpcpp.h>
#include "stockledger/ledger.pb.h"
#include "stockledger/service.pb.h"
#include "stockledger/service.grpc.pb.h"
#include "errors.hpp"

namespace stockledger {

/**
 * Client for the InventoryLedger service.
 *
 * Every method blocks until the server answers and throws GrpcError on a
 * non-OK status. Rejected changes carry the server's Rejection, so the
 * caller can see the rule and the values that caused it.
 *
 * Example:
 *   auto client = LedgerClient::connect("localhost:51010");
 *   try {
 *       client->submit_change(helpers::make_change(1, 10, SOLD, -3, "order-17"));
 *   } catch (const GrpcError& e) {
 *       if (e.has_rejection() && e.rejection().rule() == rules::INSUFFICIENT_STOCK) {
 *           // back-order
 *       }
 *   }
 */
class LedgerClient {
public:
    /**
     * Connect to a ledger server at the given endpoint.
     *
     * @param endpoint Server endpoint (e.g., "localhost:51010")
     */
    static std::unique_ptr<LedgerClient> connect(const std::string& endpoint) {
        auto channel = grpc::CreateChannel(format_endpoint(endpoint),
                                           grpc::InsecureChannelCredentials());
        return std::make_unique<LedgerClient>(channel);
    }

    /**
     * Connect using an endpoint from environment variable with fallback.
     *
     * @param env_var Environment variable name
     * @param default_endpoint Fallback endpoint if env var is not set
     */
    static std::unique_ptr<LedgerClient> from_env(const std::string& env_var,
                                                  const std::string& default_endpoint) {
        const char* endpoint = std::getenv(env_var.c_str());
        return connect(endpoint ? endpoint : default_endpoint);
    }

    /**
     * Create a client from an existing channel.
     *
     * @param channel Shared gRPC channel
     */
    explicit LedgerClient(std::shared_ptr<grpc::Channel> channel)
        : stub_(InventoryLedger::NewStub(channel)) {}

    InventoryChangeEvent submit_change(const ChangeRequest& change) {
        SubmitChangeRequest request;
        *request.mutable_change() = change;
        SubmitChangeResponse response;
        grpc::ClientContext context;
        check(stub_->SubmitChange(&context, request, &response));
        return response.event();
    }

    std::vector<InventoryChangeEvent> submit_batch(const std::vector<ChangeRequest>& changes) {
        SubmitBatchRequest request;
        for (const auto& change : changes) {
            *request.add_changes() = change;
        }
        SubmitBatchResponse response;
        grpc::ClientContext context;
        check(stub_->SubmitBatch(&context, request, &response));
        return {response.events().begin(), response.events().end()};
    }

    GetQuantityResponse get_quantity(const InventoryKey& key) {
        GetQuantityRequest request;
        *request.mutable_key() = key;
        GetQuantityResponse response;
        grpc::ClientContext context;
        check(stub_->GetQuantity(&context, request, &response));
        return response;
    }

    GetBundleAvailabilityResponse get_bundle_availability(int64_t bundle_id, int64_t warehouse_id) {
        GetBundleAvailabilityRequest request;
        request.set_bundle_id(bundle_id);
        request.set_warehouse_id(warehouse_id);
        GetBundleAvailabilityResponse response;
        grpc::ClientContext context;
        check(stub_->GetBundleAvailability(&context, request, &response));
        return response;
    }

    std::vector<InventoryChangeEvent> get_history(const InventoryKey& key, int64_t since_event_id = 0) {
        GetHistoryRequest request;
        *request.mutable_key() = key;
        request.set_since_event_id(since_event_id);
        GetHistoryResponse response;
        grpc::ClientContext context;
        check(stub_->GetHistory(&context, request, &response));
        return {response.events().begin(), response.events().end()};
    }

    ReconcileResponse reconcile(const InventoryKey& key) {
        ReconcileRequest request;
        *request.mutable_key() = key;
        ReconcileResponse response;
        grpc::ClientContext context;
        check(stub_->Reconcile(&context, request, &response));
        return response;
    }

    VerifyResponse verify(const InventoryKey& key) {
        VerifyRequest request;
        *request.mutable_key() = key;
        VerifyResponse response;
        grpc::ClientContext context;
        check(stub_->Verify(&context, request, &response));
        return response;
    }

    GetLowStockAlertsResponse get_low_stock_alerts(int64_t company_id) {
        GetLowStockAlertsRequest request;
        request.set_company_id(company_id);
        GetLowStockAlertsResponse response;
        grpc::ClientContext context;
        check(stub_->GetLowStockAlerts(&context, request, &response));
        return response;
    }

private:
    std::unique_ptr<InventoryLedger::Stub> stub_;

    static void check(const grpc::Status& status) {
        if (!status.ok()) {
            throw GrpcError(status.error_message(), status.error_code(), status.error_details());
        }
    }

    static std::string format_endpoint(const std::string& endpoint) {
        if (endpoint.find("://") == std::string::npos) {
            return endpoint;
        }
        auto pos = endpoint.find("://");
        return endpoint.substr(pos + 3);
    }
};

} // namespace stockledger
