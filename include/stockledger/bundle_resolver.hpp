#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <vector>
#include "catalog.hpp"
#include "commit_watermark.hpp"
#include "projector.hpp"

namespace stockledger {

/**
 * Result of one availability query.
 */
struct BundleAvailability {
    int64_t product_id = 0;
    int64_t warehouse_id = 0;
    int64_t availability = 0;
    // Commit watermark every component quantity was read at.
    int64_t as_of_event_id = 0;
};

/**
 * Directed bundle -> component graph reachable from one product, built
 * fresh from the catalog for each resolution.
 */
struct BundleGraph {
    struct Node {
        bool is_bundle = false;
        std::vector<BundleComponent> components;
    };

    std::map<int64_t, Node> nodes;
    // Post-order: every component appears before the bundles using it.
    std::vector<int64_t> evaluation_order;
};

/**
 * Computes sellable availability of (possibly nested) bundles.
 *
 * A leaf's availability is its projected quantity; a bundle's is the
 * minimum over its components of floor(component availability /
 * quantity_per_bundle). All quantities of one query are read at a single
 * commit watermark.
 */
class BundleResolver {
public:
    BundleResolver(const ReferenceCatalog& catalog, const QuantityProjector& projector,
                   const CommitWatermark& watermark);

    /**
     * @throws UnknownReferenceError if the product is not in the catalog
     * @throws BundleCycleDetectedError, InvalidBundleDefinitionError
     * @throws SnapshotUnavailableError if the pinned snapshot was discarded
     */
    BundleAvailability resolve(int64_t product_id, int64_t warehouse_id) const;

    int64_t availability(int64_t product_id, int64_t warehouse_id) const {
        return resolve(product_id, warehouse_id).availability;
    }

    /**
     * Build and validate the graph reachable from a product.
     *
     * @throws UnknownReferenceError, BundleCycleDetectedError,
     *         InvalidBundleDefinitionError
     */
    BundleGraph build_graph(int64_t product_id) const;

    /**
     * Evaluate a validated graph bottom-up with one memo per call.
     */
    static std::map<int64_t, int64_t> evaluate(
        const BundleGraph& graph,
        const std::function<int64_t(int64_t product_id)>& leaf_quantity);

private:
    const ReferenceCatalog& catalog_;
    const QuantityProjector& projector_;
    const CommitWatermark& watermark_;
};

} // namespace stockledger
