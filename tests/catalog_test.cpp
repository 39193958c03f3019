#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "stockledger/catalog.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/logging.hpp"

using namespace stockledger;

namespace {

nlohmann::json sample_document() {
    return nlohmann::json::parse(R"({
        "warehouses": [
            {"id": 1, "company_id": 7, "name": "Main"},
            {"id": 2, "company_id": 7, "name": "Overflow", "retired": true},
            {"id": 3, "company_id": 8, "name": "Elsewhere"}
        ],
        "suppliers": [
            {"id": 5, "name": "Acme", "contact_email": "orders@acme.test"}
        ],
        "products": [
            {"id": 10, "sku": "WID-1", "name": "Widget", "low_stock_threshold": 20, "supplier_id": 5},
            {"id": 11, "sku": "GAD-1", "name": "Gadget"},
            {"id": 20, "sku": "KIT-1", "name": "Kit", "is_bundle": true,
             "components": [{"product_id": 10, "quantity": 2}, {"product_id": 11, "quantity": 1}]}
        ]
    })");
}

Product simple_product(int64_t id, const std::string& sku) {
    Product product;
    product.product_id = id;
    product.sku = sku;
    product.name = sku;
    return product;
}

} // anonymous namespace

// =============================================================================
// JSON Loading Tests
// =============================================================================

TEST(InMemoryCatalogTest, FromJson_ShouldLoadProductsWarehousesAndSuppliers) {
    auto catalog = InMemoryCatalog::from_json(sample_document());

    EXPECT_EQ(catalog->product_count(), 3u);

    auto widget = catalog->get_product(10);
    ASSERT_TRUE(widget.has_value());
    EXPECT_EQ(widget->sku, "WID-1");
    EXPECT_EQ(widget->low_stock_threshold, 20);
    EXPECT_EQ(widget->supplier_id, 5);
    EXPECT_FALSE(widget->is_bundle);

    auto gadget = catalog->get_product(11);
    ASSERT_TRUE(gadget.has_value());
    EXPECT_FALSE(gadget->low_stock_threshold.has_value());

    auto supplier = catalog->get_supplier(5);
    ASSERT_TRUE(supplier.has_value());
    EXPECT_EQ(supplier->contact_email, "orders@acme.test");

    auto overflow = catalog->get_warehouse(2);
    ASSERT_TRUE(overflow.has_value());
    EXPECT_TRUE(overflow->retired);
}

TEST(InMemoryCatalogTest, GetComponents_ShouldKeepDefinitionOrder) {
    auto catalog = InMemoryCatalog::from_json(sample_document());

    auto components = catalog->get_components(20);

    ASSERT_EQ(components.size(), 2u);
    EXPECT_EQ(components[0].product_id, 10);
    EXPECT_EQ(components[0].quantity_per_bundle, 2);
    EXPECT_EQ(components[1].product_id, 11);
}

TEST(InMemoryCatalogTest, GetComponents_ForNonBundleOrUnknown_ShouldBeEmpty) {
    auto catalog = InMemoryCatalog::from_json(sample_document());
    EXPECT_TRUE(catalog->get_components(10).empty());
    EXPECT_TRUE(catalog->get_components(999).empty());
}

TEST(InMemoryCatalogTest, WarehousesForCompany_ShouldIncludeRetiredWarehouses) {
    auto catalog = InMemoryCatalog::from_json(sample_document());

    auto warehouses = catalog->warehouses_for_company(7);

    ASSERT_EQ(warehouses.size(), 2u);
    EXPECT_EQ(warehouses[0].warehouse_id, 1);
    EXPECT_EQ(warehouses[1].warehouse_id, 2);
    EXPECT_TRUE(catalog->warehouses_for_company(99).empty());
}

TEST(InMemoryCatalogTest, FromJson_WithMissingSku_ShouldThrowConfigError) {
    auto document = nlohmann::json::parse(R"({"products": [{"id": 1, "name": "No sku"}]})");
    EXPECT_THROW(InMemoryCatalog::from_json(document), ConfigError);
}

TEST(InMemoryCatalogTest, LoadFile_WhenMissing_ShouldThrowConfigError) {
    EXPECT_THROW(InMemoryCatalog::load_file("/nonexistent/stockledger/catalog.json"), ConfigError);
}

TEST(InMemoryCatalogTest, LoadFile_ShouldParseDocument) {
    set_log_level(LogLevel::Error);
    auto path = (std::filesystem::temp_directory_path() / "stockledger_catalog_test.json").string();
    {
        std::ofstream out(path);
        out << sample_document().dump();
    }

    auto catalog = InMemoryCatalog::load_file(path);

    EXPECT_EQ(catalog->product_count(), 3u);
    std::filesystem::remove(path);
    set_log_level(LogLevel::Info);
}

TEST(InMemoryCatalogTest, LoadFile_WithInvalidJson_ShouldThrowConfigError) {
    auto path = (std::filesystem::temp_directory_path() / "stockledger_catalog_bad.json").string();
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(InMemoryCatalog::load_file(path), ConfigError);
    std::filesystem::remove(path);
}

// =============================================================================
// Upsert Rule Tests
// =============================================================================

TEST(InMemoryCatalogTest, UpsertProduct_WithDuplicateSku_ShouldThrowConfigError) {
    InMemoryCatalog catalog;
    catalog.upsert_product(simple_product(1, "SKU-A"));
    EXPECT_THROW(catalog.upsert_product(simple_product(2, "SKU-A")), ConfigError);
}

TEST(InMemoryCatalogTest, UpsertProduct_ChangingSku_ShouldThrowConfigError) {
    InMemoryCatalog catalog;
    catalog.upsert_product(simple_product(1, "SKU-A"));
    EXPECT_THROW(catalog.upsert_product(simple_product(1, "SKU-B")), ConfigError);
}

TEST(InMemoryCatalogTest, UpsertProduct_SameSkuSameId_ShouldReplaceProduct) {
    InMemoryCatalog catalog;
    catalog.upsert_product(simple_product(1, "SKU-A"));
    auto renamed = simple_product(1, "SKU-A");
    renamed.name = "Renamed";

    catalog.upsert_product(renamed);

    EXPECT_EQ(catalog.get_product(1)->name, "Renamed");
}

TEST(InMemoryCatalogTest, UpsertProduct_NonBundleWithComponents_ShouldThrowConfigError) {
    InMemoryCatalog catalog;
    auto product = simple_product(1, "SKU-A");
    product.components.push_back({2, 1});
    EXPECT_THROW(catalog.upsert_product(product), ConfigError);
}

TEST(InMemoryCatalogTest, UpsertProduct_WithNonPositiveComponentQuantity_ShouldThrowConfigError) {
    InMemoryCatalog catalog;
    auto bundle = simple_product(1, "KIT");
    bundle.is_bundle = true;
    bundle.components.push_back({2, 0});
    EXPECT_THROW(catalog.upsert_product(bundle), ConfigError);
}

TEST(InMemoryCatalogTest, UpsertProduct_WithRepeatedComponent_ShouldThrowConfigError) {
    InMemoryCatalog catalog;
    auto bundle = simple_product(1, "KIT");
    bundle.is_bundle = true;
    bundle.components.push_back({2, 1});
    bundle.components.push_back({2, 3});
    EXPECT_THROW(catalog.upsert_product(bundle), ConfigError);
}

// =============================================================================
// Retirement Tests
// =============================================================================

TEST(InMemoryCatalogTest, RetireProduct_ShouldKeepProductResolvable) {
    InMemoryCatalog catalog;
    catalog.upsert_product(simple_product(1, "SKU-A"));

    catalog.retire_product(1);

    auto product = catalog.get_product(1);
    ASSERT_TRUE(product.has_value());
    EXPECT_TRUE(product->retired);
}

TEST(InMemoryCatalogTest, RetireUnknown_ShouldThrowUnknownReference) {
    InMemoryCatalog catalog;
    EXPECT_THROW(catalog.retire_product(42), UnknownReferenceError);
    EXPECT_THROW(catalog.retire_warehouse(42), UnknownReferenceError);
}
