#include "stockledger/bundle_resolver.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/helpers.hpp"
#include "stockledger/logging.hpp"

#include <algorithm>
#include <limits>
#include <optional>
#include <unordered_map>

namespace stockledger {

namespace {

enum class Mark { InProgress, Done };

/**
 * Depth-first walk with a recursion-stack marker. A component found
 * InProgress closes a cycle.
 */
class GraphBuilder {
public:
    GraphBuilder(const ReferenceCatalog& catalog, BundleGraph& graph)
        : catalog_(catalog), graph_(graph) {}

    void visit(int64_t product_id, std::optional<int64_t> parent_id) {
        auto mark = marks_.find(product_id);
        if (mark != marks_.end()) {
            if (mark->second == Mark::InProgress) {
                throw BundleCycleDetectedError("bundle cycle: " + cycle_path(product_id));
            }
            return;
        }

        auto product = catalog_.get_product(product_id);
        if (!product) {
            if (!parent_id) {
                throw UnknownReferenceError("unknown product " + std::to_string(product_id));
            }
            throw InvalidBundleDefinitionError(
                "bundle " + std::to_string(*parent_id) + " references missing component " +
                std::to_string(product_id));
        }

        BundleGraph::Node node;
        node.is_bundle = product->is_bundle;
        if (node.is_bundle) {
            node.components = catalog_.get_components(product_id);
            if (node.components.empty()) {
                throw InvalidBundleDefinitionError(
                    "bundle " + std::to_string(product_id) + " has no components");
            }
            for (const auto& component : node.components) {
                if (component.quantity_per_bundle <= 0) {
                    throw InvalidBundleDefinitionError(
                        "bundle " + std::to_string(product_id) + " component " +
                        std::to_string(component.product_id) + " has non-positive quantity");
                }
            }
        }

        marks_[product_id] = Mark::InProgress;
        stack_.push_back(product_id);
        for (const auto& component : node.components) {
            visit(component.product_id, product_id);
        }
        stack_.pop_back();
        marks_[product_id] = Mark::Done;

        graph_.nodes[product_id] = std::move(node);
        graph_.evaluation_order.push_back(product_id);
    }

private:
    std::string cycle_path(int64_t repeated) const {
        auto start = std::find(stack_.begin(), stack_.end(), repeated);
        std::string path;
        for (auto it = start; it != stack_.end(); ++it) {
            path += std::to_string(*it) + " -> ";
        }
        return path + std::to_string(repeated);
    }

    const ReferenceCatalog& catalog_;
    BundleGraph& graph_;
    std::unordered_map<int64_t, Mark> marks_;
    std::vector<int64_t> stack_;
};

} // anonymous namespace

BundleResolver::BundleResolver(const ReferenceCatalog& catalog, const QuantityProjector& projector,
                               const CommitWatermark& watermark)
    : catalog_(catalog), projector_(projector), watermark_(watermark) {}

BundleGraph BundleResolver::build_graph(int64_t product_id) const {
    BundleGraph graph;
    try {
        GraphBuilder(catalog_, graph).visit(product_id, std::nullopt);
    } catch (const BundleCycleDetectedError& e) {
        log_error("bundle_resolver", "bundle_cycle_detected",
                  {{"product_id", product_id}, {"detail", e.what()}});
        throw;
    } catch (const InvalidBundleDefinitionError& e) {
        log_error("bundle_resolver", "invalid_bundle_definition",
                  {{"product_id", product_id}, {"detail", e.what()}});
        throw;
    }
    return graph;
}

std::map<int64_t, int64_t> BundleResolver::evaluate(
    const BundleGraph& graph, const std::function<int64_t(int64_t)>& leaf_quantity) {
    std::map<int64_t, int64_t> memo;
    for (int64_t product_id : graph.evaluation_order) {
        const auto& node = graph.nodes.at(product_id);
        if (!node.is_bundle) {
            // Negative drift cannot be assembled into bundles.
            memo[product_id] = std::max<int64_t>(leaf_quantity(product_id), 0);
            continue;
        }
        int64_t available = std::numeric_limits<int64_t>::max();
        for (const auto& component : node.components) {
            int64_t per_bundle = helpers::floor_div(memo.at(component.product_id),
                                                    component.quantity_per_bundle);
            available = std::min(available, per_bundle);
        }
        memo[product_id] = available;
    }
    return memo;
}

BundleAvailability BundleResolver::resolve(int64_t product_id, int64_t warehouse_id) const {
    auto graph = build_graph(product_id);

    BundleAvailability result;
    result.product_id = product_id;
    result.warehouse_id = warehouse_id;
    result.as_of_event_id = watermark_.watermark();

    auto memo = evaluate(graph, [&](int64_t leaf_id) {
        return projector_.quantity_at({warehouse_id, leaf_id}, result.as_of_event_id);
    });
    result.availability = memo.at(product_id);

    log_debug("bundle_resolver", "availability_resolved",
              {{"product_id", product_id}, {"warehouse_id", warehouse_id},
               {"availability", result.availability}, {"as_of_event_id", result.as_of_event_id},
               {"nodes", graph.nodes.size()}});
    return result;
}

} // namespace stockledger
