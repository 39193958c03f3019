#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <tuple>
#include <google/protobuf/timestamp.pb.h>
#include "stockledger/ledger.pb.h"

namespace stockledger {

/**
 * Value form of InventoryKey, usable as a map key.
 */
struct KeyRef {
    int64_t warehouse_id = 0;
    int64_t product_id = 0;

    bool operator==(const KeyRef& other) const {
        return warehouse_id == other.warehouse_id && product_id == other.product_id;
    }
    bool operator!=(const KeyRef& other) const { return !(*this == other); }
    bool operator<(const KeyRef& other) const {
        return std::tie(warehouse_id, product_id) <
               std::tie(other.warehouse_id, other.product_id);
    }
};

struct KeyRefHash {
    size_t operator()(const KeyRef& key) const {
        size_t h = std::hash<int64_t>{}(key.warehouse_id);
        return h ^ (std::hash<int64_t>{}(key.product_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

/**
 * Helper functions for working with ledger types.
 */
namespace helpers {

inline KeyRef key_ref(const InventoryKey& key) {
    return {key.warehouse_id(), key.product_id()};
}

inline InventoryKey make_key(int64_t warehouse_id, int64_t product_id) {
    InventoryKey key;
    key.set_warehouse_id(warehouse_id);
    key.set_product_id(product_id);
    return key;
}

inline InventoryKey to_proto(const KeyRef& key) {
    return make_key(key.warehouse_id, key.product_id);
}

/**
 * Format a key as "w<warehouse>/p<product>" for logs and messages.
 */
std::string key_string(const KeyRef& key);

inline std::string key_string(const InventoryKey& key) {
    return key_string(key_ref(key));
}

/**
 * Lower-case name of a change type ("received", "sold", ...).
 */
std::string change_type_name(ChangeType type);

/**
 * Parse a lower-case change type name. Returns CHANGE_TYPE_UNSPECIFIED
 * for unknown names.
 */
ChangeType parse_change_type(const std::string& name);

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Build a change request.
 */
ChangeRequest make_change(int64_t warehouse_id, int64_t product_id, ChangeType type,
                          int64_t quantity_delta, const std::string& reference = "");

/**
 * Floor division that rounds toward negative infinity.
 */
inline int64_t floor_div(int64_t numerator, int64_t denominator) {
    int64_t q = numerator / denominator;
    if ((numerator % denominator != 0) && ((numerator < 0) != (denominator < 0))) {
        --q;
    }
    return q;
}

} // namespace helpers
} // namespace stockledger
