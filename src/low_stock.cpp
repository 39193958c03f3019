#include "stockledger/low_stock.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/helpers.hpp"

#include <cmath>
#include <google/protobuf/util/time_util.h>

namespace stockledger {

using google::protobuf::util::TimeUtil;

LowStockReporter::LowStockReporter(const ReferenceCatalog& catalog, const LedgerStore& store,
                                   const QuantityProjector& projector, int sales_window_days)
    : catalog_(catalog)
    , store_(store)
    , projector_(projector)
    , sales_window_days_(sales_window_days) {}

std::optional<int64_t> LowStockReporter::days_until_stockout(int64_t current_quantity,
                                                             int64_t units_sold,
                                                             int window_days) {
    if (units_sold <= 0 || window_days <= 0) return std::nullopt;
    if (current_quantity <= 0) return 0;
    double avg_daily_sales = static_cast<double>(units_sold) / window_days;
    return static_cast<int64_t>(std::ceil(current_quantity / avg_daily_sales));
}

std::vector<LowStockAlert> LowStockReporter::alerts(int64_t company_id,
                                                    const google::protobuf::Timestamp& now) const {
    auto warehouses = catalog_.warehouses_for_company(company_id);
    if (warehouses.empty()) {
        throw UnknownReferenceError("unknown company " + std::to_string(company_id));
    }
    const auto since = now - TimeUtil::HoursToDuration(24 * sales_window_days_);

    std::vector<LowStockAlert> result;
    const auto keys = store_.keys();
    for (const auto& warehouse : warehouses) {
        if (warehouse.retired) continue;

        for (const auto& key : keys) {
            if (key.warehouse_id != warehouse.warehouse_id) continue;

            auto product = catalog_.get_product(key.product_id);
            if (!product || product->retired || product->is_bundle || !product->low_stock_threshold) {
                continue;
            }
            const int64_t threshold = *product->low_stock_threshold;
            const int64_t current = projector_.current_quantity(key);
            if (current >= threshold) continue;

            int64_t units_sold = 0;
            for (const auto& event : store_.read_from(key, 0)) {
                if (event.change_type() == SOLD && event.occurred_at() >= since) {
                    units_sold -= event.quantity_delta();
                }
            }
            if (units_sold <= 0) continue;

            LowStockAlert alert;
            alert.set_product_id(product->product_id);
            alert.set_product_name(product->name);
            alert.set_sku(product->sku);
            alert.set_warehouse_id(warehouse.warehouse_id);
            alert.set_warehouse_name(warehouse.name);
            alert.set_current_stock(current);
            alert.set_threshold(threshold);
            if (auto days = days_until_stockout(current, units_sold, sales_window_days_)) {
                alert.set_days_until_stockout(*days);
            }
            if (product->supplier_id) {
                if (auto supplier = catalog_.get_supplier(*product->supplier_id)) {
                    auto* ref = alert.mutable_supplier();
                    ref->set_supplier_id(supplier->supplier_id);
                    ref->set_name(supplier->name);
                    ref->set_contact_email(supplier->contact_email);
                }
            }
            result.push_back(std::move(alert));
        }
    }
    return result;
}

} // namespace stockledger
