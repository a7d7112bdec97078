#include "domain/events/CartEvent.hpp"
#include <nlohmann/json.hpp>

namespace placement::domain {

CartEvent CartEvent::fromJson(const std::string& json) {
    auto j = nlohmann::json::parse(json);

    CartEvent event(j.value("eventType", ""));
    event.readBase(j);
    event.userId = j.value("userId", "");
    event.itemId = j.value("itemId", "");
    event.sku = j.value("sku", "");
    event.quantity = j.value("quantity", 0);
    event.version = j.value("version", int64_t{0});
    return event;
}

std::string CartEvent::toJson() const {
    nlohmann::json j;
    writeBase(j);
    j["userId"] = userId;
    if (!itemId.empty()) {
        j["itemId"] = itemId;
        j["sku"] = sku;
        j["quantity"] = quantity;
    }
    j["version"] = version;
    return j.dump();
}

} // namespace placement::domain
