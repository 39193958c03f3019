#include "stockledger/validation.hpp"
#include "stockledger/helpers.hpp"

#include <limits>

namespace stockledger {
namespace validation {

namespace {

[[noreturn]] void reject_invalid(const char* rule, const ChangeRequest& request, const std::string& message) {
    throw ValidationError(make_rejection(rule, request, ProjectionState{}, message));
}

bool add_overflows(int64_t a, int64_t b) {
    return b > 0 ? a > std::numeric_limits<int64_t>::max() - b
                 : a < std::numeric_limits<int64_t>::min() - b;
}

bool sub_overflows(int64_t a, int64_t b) {
    return b < 0 ? a > std::numeric_limits<int64_t>::max() + b
                 : a < std::numeric_limits<int64_t>::min() + b;
}

} // anonymous namespace

Rejection make_rejection(const char* rule, const ChangeRequest& request,
                         const ProjectionState& state, const std::string& message) {
    Rejection rejection;
    rejection.set_rule(rule);
    *rejection.mutable_key() = request.key();
    rejection.set_change_type(request.change_type());
    rejection.set_attempted_delta(request.quantity_delta());
    rejection.set_current_quantity(state.current_quantity);
    rejection.set_outstanding_reserved(state.outstanding_reserved);
    rejection.set_message(message);
    return rejection;
}

void require_well_formed(const ChangeRequest& request) {
    if (!request.has_key()) {
        reject_invalid(rules::MISSING_KEY, request, "inventory key is required");
    }
    if (request.quantity_delta() == 0) {
        reject_invalid(rules::NON_ZERO_DELTA, request, "quantity_delta must be non-zero");
    }

    const int64_t delta = request.quantity_delta();
    switch (request.change_type()) {
        case RECEIVED:
            if (delta < 0) reject_invalid(rules::DELTA_SIGN, request, "received quantity must be positive");
            break;
        case SOLD:
            if (delta > 0) reject_invalid(rules::DELTA_SIGN, request, "sold quantity must be negative");
            break;
        case RESERVED:
            if (delta > 0) reject_invalid(rules::DELTA_SIGN, request, "reserved quantity must be negative");
            break;
        case RELEASED:
            if (delta < 0) reject_invalid(rules::DELTA_SIGN, request, "released quantity must be positive");
            break;
        case ADJUSTMENT:
            if (request.reference().empty()) {
                reject_invalid(rules::ADJUSTMENT_REFERENCE, request, "adjustment requires a reference");
            }
            break;
        default:
            reject_invalid(rules::CHANGE_TYPE, request, "unknown change type");
    }
}

void require_stockable(const ChangeRequest& request, const ReferenceCatalog& catalog) {
    const auto& key = request.key();
    auto product = catalog.get_product(key.product_id());
    if (!product) {
        throw UnknownReferenceError("unknown product " + std::to_string(key.product_id()));
    }
    auto warehouse = catalog.get_warehouse(key.warehouse_id());
    if (!warehouse) {
        throw UnknownReferenceError("unknown warehouse " + std::to_string(key.warehouse_id()));
    }
    if (product->is_bundle) {
        reject_invalid(rules::BUNDLE_NOT_STOCKED, request,
                       "bundle " + product->sku + " is not stocked directly");
    }
    if (request.change_type() == ADJUSTMENT) return;
    if (product->retired) {
        reject_invalid(rules::RETIRED_REFERENCE, request, "product " + product->sku + " is retired");
    }
    if (warehouse->retired) {
        reject_invalid(rules::RETIRED_REFERENCE, request,
                       "warehouse " + warehouse->name + " is retired");
    }
}

void require_sufficient(const ChangeRequest& request, const ProjectionState& state) {
    const int64_t delta = request.quantity_delta();
    const bool moves_reservation = request.change_type() == RESERVED || request.change_type() == RELEASED;
    if (add_overflows(state.current_quantity, delta) ||
        (moves_reservation && sub_overflows(state.outstanding_reserved, delta))) {
        throw ValidationError(make_rejection(
            rules::QUANTITY_OVERFLOW, request, state, "quantity would exceed the representable range"));
    }

    switch (request.change_type()) {
        case SOLD:
        case RESERVED:
            if (state.current_quantity + delta < 0) {
                throw InsufficientStockError(make_rejection(
                    rules::INSUFFICIENT_STOCK, request, state,
                    "insufficient stock for " + helpers::change_type_name(request.change_type())));
            }
            break;
        case RELEASED:
            if (delta > state.outstanding_reserved) {
                throw OverReleaseError(make_rejection(
                    rules::OVER_RELEASE, request, state,
                    "release exceeds outstanding reserved quantity"));
            }
            break;
        default:
            break;
    }
}

} // namespace validation
} // namespace stockledger
