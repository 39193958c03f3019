#include <gtest/gtest.h>
#include "stockledger/bundle_resolver.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/helpers.hpp"
#include "stockledger/logging.hpp"

using namespace stockledger;

class BundleResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_level(LogLevel::Error);
    }

    void TearDown() override {
        set_log_level(LogLevel::Info);
    }

    void add_product(int64_t id) {
        Product product;
        product.product_id = id;
        product.sku = "P-" + std::to_string(id);
        catalog_.upsert_product(product);
    }

    void add_bundle(int64_t id, std::vector<BundleComponent> components) {
        Product product;
        product.product_id = id;
        product.sku = "B-" + std::to_string(id);
        product.is_bundle = true;
        product.components = std::move(components);
        catalog_.upsert_product(product);
    }

    // Record a quantity change for warehouse 1 and commit it.
    void stock(int64_t product_id, int64_t delta) {
        InventoryChangeEvent event;
        *event.mutable_key() = helpers::make_key(1, product_id);
        event.set_change_type(delta > 0 ? RECEIVED : ADJUSTMENT);
        event.set_quantity_delta(delta);
        store_.append(event);
        projector_.apply(event);
        watermark_.complete({event.event_id()});
    }

    InMemoryCatalog catalog_;
    InMemoryLedgerStore store_;
    QuantityProjector projector_{store_};
    CommitWatermark watermark_;
    BundleResolver resolver_{catalog_, projector_, watermark_};
};

// =============================================================================
// Availability Tests
// =============================================================================

TEST_F(BundleResolverTest, Availability_ShouldBeLimitedByScarcestComponent) {
    // Given B = 2 x P + 1 x Q with P=7 and Q=10
    add_product(1);
    add_product(2);
    add_bundle(100, {{1, 2}, {2, 1}});
    stock(1, 7);
    stock(2, 10);

    // Then availability is min(floor(7/2), floor(10/1)) = 3
    auto result = resolver_.resolve(100, 1);
    EXPECT_EQ(result.availability, 3);
    EXPECT_EQ(result.product_id, 100);
    EXPECT_EQ(result.warehouse_id, 1);
    EXPECT_EQ(result.as_of_event_id, 2);
}

TEST_F(BundleResolverTest, Availability_WithNestedBundles_ShouldMultiplyThrough) {
    // Inner = 3 x P, Outer = 2 x Inner + 1 x Q
    add_product(1);
    add_product(2);
    add_bundle(100, {{1, 3}});
    add_bundle(200, {{100, 2}, {2, 1}});
    stock(1, 20);
    stock(2, 9);

    // Inner = 6, Outer = min(6/2, 9) = 3
    EXPECT_EQ(resolver_.availability(100, 1), 6);
    EXPECT_EQ(resolver_.availability(200, 1), 3);
}

TEST_F(BundleResolverTest, Availability_ForNonBundle_ShouldBeItsQuantity) {
    add_product(1);
    stock(1, 12);
    EXPECT_EQ(resolver_.availability(1, 1), 12);
}

TEST_F(BundleResolverTest, Availability_WithNegativeComponent_ShouldBeZero) {
    add_product(1);
    add_product(2);
    add_bundle(100, {{1, 1}, {2, 1}});
    stock(1, -5);
    stock(2, 10);

    EXPECT_EQ(resolver_.availability(100, 1), 0);
}

TEST_F(BundleResolverTest, Availability_WithUnstockedComponent_ShouldBeZero) {
    add_product(1);
    add_product(2);
    add_bundle(100, {{1, 1}, {2, 1}});
    stock(1, 10);

    EXPECT_EQ(resolver_.availability(100, 1), 0);
}

TEST_F(BundleResolverTest, Availability_InOtherWarehouse_ShouldUseThatWarehouseStock) {
    add_product(1);
    add_bundle(100, {{1, 2}});
    stock(1, 10);

    EXPECT_EQ(resolver_.availability(100, 2), 0);
}

TEST_F(BundleResolverTest, Availability_ShouldNotDecreaseWhenComponentStockGrows) {
    add_product(1);
    add_product(2);
    add_bundle(100, {{1, 3}, {2, 2}});
    stock(2, 100);

    int64_t previous = resolver_.availability(100, 1);
    for (int i = 0; i < 30; ++i) {
        stock(1, 1);
        int64_t current = resolver_.availability(100, 1);
        EXPECT_GE(current, previous);
        previous = current;
    }
    EXPECT_EQ(previous, 10);
}

TEST_F(BundleResolverTest, Availability_ShouldReflectCatalogChangesBetweenQueries) {
    add_product(1);
    add_bundle(100, {{1, 2}});
    stock(1, 10);
    EXPECT_EQ(resolver_.availability(100, 1), 5);

    add_bundle(100, {{1, 5}});

    EXPECT_EQ(resolver_.availability(100, 1), 2);
}

// =============================================================================
// Graph Tests
// =============================================================================

TEST_F(BundleResolverTest, BuildGraph_WithSharedComponent_ShouldVisitItOnce) {
    // Diamond: top uses left and right, both use P
    add_product(1);
    add_bundle(10, {{1, 1}});
    add_bundle(11, {{1, 2}});
    add_bundle(12, {{10, 1}, {11, 1}});

    auto graph = resolver_.build_graph(12);

    EXPECT_EQ(graph.nodes.size(), 4u);
    ASSERT_EQ(graph.evaluation_order.size(), 4u);
    EXPECT_EQ(graph.evaluation_order.front(), 1);
    EXPECT_EQ(graph.evaluation_order.back(), 12);
}

TEST_F(BundleResolverTest, Evaluate_ShouldQueryEachLeafOnce) {
    add_product(1);
    add_bundle(10, {{1, 1}});
    add_bundle(11, {{1, 2}});
    add_bundle(12, {{10, 1}, {11, 1}});
    auto graph = resolver_.build_graph(12);

    int calls = 0;
    auto memo = BundleResolver::evaluate(graph, [&](int64_t) {
        ++calls;
        return int64_t{8};
    });

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(memo.at(10), 8);
    EXPECT_EQ(memo.at(11), 4);
    EXPECT_EQ(memo.at(12), 4);
}

TEST_F(BundleResolverTest, Resolve_WithTwoBundleCycle_ShouldThrowBundleCycleDetected) {
    add_bundle(10, {{11, 1}});
    add_bundle(11, {{10, 1}});

    try {
        resolver_.resolve(10, 1);
        FAIL() << "expected BundleCycleDetectedError";
    } catch (const BundleCycleDetectedError& e) {
        EXPECT_EQ(std::string(e.what()), "bundle cycle: 10 -> 11 -> 10");
    }
}

TEST_F(BundleResolverTest, Resolve_WithSelfReference_ShouldThrowBundleCycleDetected) {
    add_product(1);
    add_bundle(10, {{1, 1}, {10, 1}});
    EXPECT_THROW(resolver_.resolve(10, 1), BundleCycleDetectedError);
}

TEST_F(BundleResolverTest, Resolve_WithCycleBelowRoot_ShouldThrowBundleCycleDetected) {
    add_product(1);
    add_bundle(10, {{11, 1}});
    add_bundle(11, {{12, 1}, {1, 1}});
    add_bundle(12, {{11, 1}});
    EXPECT_THROW(resolver_.resolve(10, 1), BundleCycleDetectedError);
}

TEST_F(BundleResolverTest, Resolve_WithMissingComponent_ShouldThrowInvalidBundleDefinition) {
    add_bundle(10, {{404, 1}});
    EXPECT_THROW(resolver_.resolve(10, 1), InvalidBundleDefinitionError);
}

TEST_F(BundleResolverTest, Resolve_WithEmptyBundle_ShouldThrowInvalidBundleDefinition) {
    add_bundle(10, {});
    EXPECT_THROW(resolver_.resolve(10, 1), InvalidBundleDefinitionError);
}

TEST_F(BundleResolverTest, Resolve_UnknownProduct_ShouldThrowUnknownReference) {
    EXPECT_THROW(resolver_.resolve(777, 1), UnknownReferenceError);
}

// =============================================================================
// Snapshot Tests
// =============================================================================

TEST_F(BundleResolverTest, Resolve_ShouldIgnoreChangesNotYetCommitted) {
    add_product(1);
    add_bundle(100, {{1, 1}});
    stock(1, 4);

    // Applied to the projection but not yet completed in the watermark
    InventoryChangeEvent pending;
    *pending.mutable_key() = helpers::make_key(1, 1);
    pending.set_change_type(RECEIVED);
    pending.set_quantity_delta(50);
    store_.append(pending);
    projector_.apply(pending);

    EXPECT_EQ(resolver_.availability(100, 1), 4);

    watermark_.complete({pending.event_id()});
    EXPECT_EQ(resolver_.availability(100, 1), 54);
}
