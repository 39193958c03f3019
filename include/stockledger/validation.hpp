#pragma once

#include <string>
#include "stockledger/ledger.pb.h"
#include "catalog.hpp"
#include "errors.hpp"
#include "projector.hpp"

namespace stockledger {
namespace validation {

/**
 * Build a rejection for a request against the given projection.
 */
Rejection make_rejection(const char* rule, const ChangeRequest& request,
                         const ProjectionState& state, const std::string& message);

/**
 * Shape rules that need no stock: non-zero delta, sign by change type,
 * reference on adjustments.
 *
 * @throws ValidationError
 */
void require_well_formed(const ChangeRequest& request);

/**
 * Reference rules: product and warehouse known to the catalog, product
 * not a bundle, neither retired unless the change is an adjustment.
 *
 * @throws UnknownReferenceError, ValidationError
 */
void require_stockable(const ChangeRequest& request, const ReferenceCatalog& catalog);

/**
 * Stock rules evaluated against the current projection of the key:
 * sold/reserved may not go below zero, released may not exceed the
 * outstanding reserved quantity. A change whose result does not fit in
 * int64 is rejected as quantity_overflow.
 *
 * @throws InsufficientStockError, OverReleaseError, ValidationError
 */
void require_sufficient(const ChangeRequest& request, const ProjectionState& state);

} // namespace validation
} // namespace stockledger
