#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace stockledger {

struct BundleComponent {
    int64_t product_id = 0;
    int64_t quantity_per_bundle = 0;
};

struct Product {
    int64_t product_id = 0;
    std::string sku;
    std::string name;
    bool is_bundle = false;
    std::vector<BundleComponent> components;
    std::optional<int64_t> low_stock_threshold;
    std::optional<int64_t> supplier_id;
    bool retired = false;
};

struct Warehouse {
    int64_t warehouse_id = 0;
    int64_t company_id = 0;
    std::string name;
    bool retired = false;
};

struct Supplier {
    int64_t supplier_id = 0;
    std::string name;
    std::string contact_email;
};

/**
 * Read-only view of the product catalog and its reference data.
 *
 * Implementations must reflect the authoritative catalog at call time;
 * the engine never caches catalog structure beyond one resolution pass.
 */
class ReferenceCatalog {
public:
    virtual ~ReferenceCatalog() = default;

    virtual std::optional<Product> get_product(int64_t product_id) const = 0;

    /**
     * Components of a bundle, in definition order. Empty for unknown
     * products and non-bundles.
     */
    virtual std::vector<BundleComponent> get_components(int64_t bundle_id) const = 0;

    virtual std::optional<Warehouse> get_warehouse(int64_t warehouse_id) const = 0;

    virtual std::optional<Supplier> get_supplier(int64_t supplier_id) const = 0;

    virtual std::vector<Warehouse> warehouses_for_company(int64_t company_id) const = 0;
};

/**
 * Thread-safe catalog held in memory, loadable from a JSON document:
 *
 *   {
 *     "warehouses": [{"id": 1, "company_id": 7, "name": "Main"}],
 *     "suppliers":  [{"id": 3, "name": "Acme", "contact_email": "orders@acme.test"}],
 *     "products": [
 *       {"id": 10, "sku": "WID-1", "name": "Widget", "low_stock_threshold": 20,
 *        "supplier_id": 3},
 *       {"id": 20, "sku": "KIT-1", "name": "Kit", "is_bundle": true,
 *        "components": [{"product_id": 10, "quantity": 2}]}
 *     ]
 *   }
 *
 * Retirement only sets a flag; retired entries stay resolvable.
 */
class InMemoryCatalog : public ReferenceCatalog {
public:
    InMemoryCatalog() = default;

    /**
     * @throws ConfigError if the document is malformed
     */
    static std::unique_ptr<InMemoryCatalog> from_json(const nlohmann::json& document);

    /**
     * @throws ConfigError if the file cannot be read or parsed
     */
    static std::unique_ptr<InMemoryCatalog> load_file(const std::string& path);

    std::optional<Product> get_product(int64_t product_id) const override;
    std::vector<BundleComponent> get_components(int64_t bundle_id) const override;
    std::optional<Warehouse> get_warehouse(int64_t warehouse_id) const override;
    std::optional<Supplier> get_supplier(int64_t supplier_id) const override;
    std::vector<Warehouse> warehouses_for_company(int64_t company_id) const override;

    /**
     * Insert or replace a product.
     *
     * @throws ConfigError on duplicate SKU, non-bundle with components,
     *         non-positive or repeated component
     */
    void upsert_product(const Product& product);
    void upsert_warehouse(const Warehouse& warehouse);
    void upsert_supplier(const Supplier& supplier);

    /**
     * @throws UnknownReferenceError if the id is not in the catalog
     */
    void retire_product(int64_t product_id);
    void retire_warehouse(int64_t warehouse_id);

    size_t product_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<int64_t, Product> products_;
    std::unordered_map<std::string, int64_t> sku_index_;
    std::map<int64_t, Warehouse> warehouses_;
    std::map<int64_t, Supplier> suppliers_;
};

} // namespace stockledger
