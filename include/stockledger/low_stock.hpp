#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <google/protobuf/timestamp.pb.h>
#include "stockledger/ledger.pb.h"
#include "catalog.hpp"
#include "ledger_store.hpp"
#include "projector.hpp"

namespace stockledger {

/**
 * Finds stock positions below their product's low-stock threshold that
 * also had sales within the look-back window.
 */
class LowStockReporter {
public:
    static constexpr int kDefaultSalesWindowDays = 30;

    LowStockReporter(const ReferenceCatalog& catalog, const LedgerStore& store,
                     const QuantityProjector& projector,
                     int sales_window_days = kDefaultSalesWindowDays);

    /**
     * Alerts for every active warehouse of a company, ordered by
     * warehouse then product.
     *
     * @throws UnknownReferenceError if the company has no warehouses
     */
    std::vector<LowStockAlert> alerts(int64_t company_id,
                                      const google::protobuf::Timestamp& now) const;

    /**
     * ceil(current / (units_sold / window_days)); 0 once stock is gone.
     * Unset when nothing sold.
     */
    static std::optional<int64_t> days_until_stockout(int64_t current_quantity,
                                                      int64_t units_sold, int window_days);

private:
    const ReferenceCatalog& catalog_;
    const LedgerStore& store_;
    const QuantityProjector& projector_;
    int sales_window_days_;
};

} // namespace stockledger
