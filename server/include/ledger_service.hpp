#pragma once

#include <memory>
#include "stockledger/engine.hpp"
#include "stockledger/service.grpc.pb.h"

namespace stockledger {
namespace server {

/**
 * Create the InventoryLedger gRPC service over an engine. The engine
 * must outlive the service.
 */
std::unique_ptr<InventoryLedger::Service> create_ledger_service(InventoryEngine& engine);

} // namespace server
} // namespace stockledger
