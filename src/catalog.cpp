#include "stockledger/catalog.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/logging.hpp"

#include <fstream>
#include <mutex>
#include <set>

namespace stockledger {

namespace {

template<typename T>
std::optional<T> optional_field(const nlohmann::json& object, const char* name) {
    auto it = object.find(name);
    if (it == object.end() || it->is_null()) return std::nullopt;
    return it->get<T>();
}

Product parse_product(const nlohmann::json& p) {
    Product product;
    product.product_id = p.at("id").get<int64_t>();
    product.sku = p.at("sku").get<std::string>();
    product.name = p.value("name", "");
    product.is_bundle = p.value("is_bundle", false);
    product.retired = p.value("retired", false);
    product.low_stock_threshold = optional_field<int64_t>(p, "low_stock_threshold");
    product.supplier_id = optional_field<int64_t>(p, "supplier_id");
    if (auto it = p.find("components"); it != p.end()) {
        for (const auto& c : *it) {
            product.components.push_back(
                {c.at("product_id").get<int64_t>(), c.at("quantity").get<int64_t>()});
        }
    }
    return product;
}

} // anonymous namespace

std::unique_ptr<InMemoryCatalog> InMemoryCatalog::from_json(const nlohmann::json& document) {
    auto catalog = std::make_unique<InMemoryCatalog>();
    try {
        for (const auto& w : document.value("warehouses", nlohmann::json::array())) {
            Warehouse warehouse;
            warehouse.warehouse_id = w.at("id").get<int64_t>();
            warehouse.company_id = w.at("company_id").get<int64_t>();
            warehouse.name = w.value("name", "");
            warehouse.retired = w.value("retired", false);
            catalog->upsert_warehouse(warehouse);
        }
        for (const auto& s : document.value("suppliers", nlohmann::json::array())) {
            Supplier supplier;
            supplier.supplier_id = s.at("id").get<int64_t>();
            supplier.name = s.value("name", "");
            supplier.contact_email = s.value("contact_email", "");
            catalog->upsert_supplier(supplier);
        }
        for (const auto& p : document.value("products", nlohmann::json::array())) {
            catalog->upsert_product(parse_product(p));
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("malformed catalog document: ") + e.what());
    }
    return catalog;
}

std::unique_ptr<InMemoryCatalog> InMemoryCatalog::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open catalog file: " + path);
    }
    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("cannot parse catalog file " + path + ": " + e.what());
    }
    auto catalog = from_json(document);
    log_info("catalog", "catalog_loaded", {{"path", path}, {"products", catalog->product_count()}});
    return catalog;
}

std::optional<Product> InMemoryCatalog::get_product(int64_t product_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = products_.find(product_id);
    if (it == products_.end()) return std::nullopt;
    return it->second;
}

std::vector<BundleComponent> InMemoryCatalog::get_components(int64_t bundle_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = products_.find(bundle_id);
    if (it == products_.end() || !it->second.is_bundle) return {};
    return it->second.components;
}

std::optional<Warehouse> InMemoryCatalog::get_warehouse(int64_t warehouse_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = warehouses_.find(warehouse_id);
    if (it == warehouses_.end()) return std::nullopt;
    return it->second;
}

std::optional<Supplier> InMemoryCatalog::get_supplier(int64_t supplier_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = suppliers_.find(supplier_id);
    if (it == suppliers_.end()) return std::nullopt;
    return it->second;
}

std::vector<Warehouse> InMemoryCatalog::warehouses_for_company(int64_t company_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Warehouse> result;
    for (const auto& [_, warehouse] : warehouses_) {
        if (warehouse.company_id == company_id) {
            result.push_back(warehouse);
        }
    }
    return result;
}

void InMemoryCatalog::upsert_product(const Product& product) {
    const std::string label = "product " + std::to_string(product.product_id);
    if (product.sku.empty()) {
        throw ConfigError(label + ": sku must not be empty");
    }
    if (!product.is_bundle && !product.components.empty()) {
        throw ConfigError(label + ": only bundles may have components");
    }
    std::set<int64_t> seen;
    for (const auto& component : product.components) {
        if (component.quantity_per_bundle <= 0) {
            throw ConfigError(label + ": component " + std::to_string(component.product_id) +
                              " quantity must be positive");
        }
        if (!seen.insert(component.product_id).second) {
            throw ConfigError(label + ": component " + std::to_string(component.product_id) +
                              " listed twice");
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto sku = sku_index_.find(product.sku);
    if (sku != sku_index_.end() && sku->second != product.product_id) {
        throw ConfigError(label + ": sku " + product.sku + " already used by product " +
                          std::to_string(sku->second));
    }
    auto existing = products_.find(product.product_id);
    if (existing != products_.end() && existing->second.sku != product.sku) {
        // SKUs are immutable once assigned.
        throw ConfigError(label + ": sku cannot change from " + existing->second.sku);
    }
    sku_index_[product.sku] = product.product_id;
    products_[product.product_id] = product;
}

void InMemoryCatalog::upsert_warehouse(const Warehouse& warehouse) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    warehouses_[warehouse.warehouse_id] = warehouse;
}

void InMemoryCatalog::upsert_supplier(const Supplier& supplier) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    suppliers_[supplier.supplier_id] = supplier;
}

void InMemoryCatalog::retire_product(int64_t product_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = products_.find(product_id);
    if (it == products_.end()) {
        throw UnknownReferenceError("unknown product " + std::to_string(product_id));
    }
    it->second.retired = true;
}

void InMemoryCatalog::retire_warehouse(int64_t warehouse_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = warehouses_.find(warehouse_id);
    if (it == warehouses_.end()) {
        throw UnknownReferenceError("unknown warehouse " + std::to_string(warehouse_id));
    }
    it->second.retired = true;
}

size_t InMemoryCatalog::product_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return products_.size();
}

} // namespace stockledger
