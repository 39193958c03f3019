#include "stockledger/helpers.hpp"

#include <chrono>

namespace stockledger {
namespace helpers {

std::string key_string(const KeyRef& key) {
    return "w" + std::to_string(key.warehouse_id) + "/p" + std::to_string(key.product_id);
}

std::string change_type_name(ChangeType type) {
    switch (type) {
        case RECEIVED: return "received";
        case SOLD: return "sold";
        case ADJUSTMENT: return "adjustment";
        case RESERVED: return "reserved";
        case RELEASED: return "released";
        default: return "unspecified";
    }
}

ChangeType parse_change_type(const std::string& name) {
    if (name == "received") return RECEIVED;
    if (name == "sold") return SOLD;
    if (name == "adjustment") return ADJUSTMENT;
    if (name == "reserved") return RESERVED;
    if (name == "released") return RELEASED;
    return CHANGE_TYPE_UNSPECIFIED;
}

google::protobuf::Timestamp now() {
    auto time_point = std::chrono::system_clock::now();
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

ChangeRequest make_change(int64_t warehouse_id, int64_t product_id, ChangeType type,
                          int64_t quantity_delta, const std::string& reference) {
    ChangeRequest request;
    *request.mutable_key() = make_key(warehouse_id, product_id);
    request.set_change_type(type);
    request.set_quantity_delta(quantity_delta);
    request.set_reference(reference);
    return request;
}

} // namespace helpers
} // namespace stockledger
