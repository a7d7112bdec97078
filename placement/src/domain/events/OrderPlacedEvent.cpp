#include "domain/events/OrderPlacedEvent.hpp"
#include <nlohmann/json.hpp>

namespace placement::domain {

OrderPlacedEvent::OrderPlacedEvent(const std::string& json)
    : DomainEvent(TYPE)
{
    if (json.empty() || json == "{}") return;

    auto j = nlohmann::json::parse(json);
    readBase(j);

    userId = j.value("userId", "");
    cartId = j.value("cartId", "");
    idempotencyKey = j.value("idempotencyKey", "");
    itemCount = j.value("itemCount", int64_t{0});

    if (j.contains("total")) {
        auto& t = j["total"];
        total.units = t.value("units", int64_t{0});
        total.nano = t.value("nano", 0);
        total.currency = t.value("currency", "USD");
    }
}

std::string OrderPlacedEvent::toJson() const {
    nlohmann::json j;
    writeBase(j);
    j["userId"] = userId;
    j["cartId"] = cartId;
    j["idempotencyKey"] = idempotencyKey;
    j["itemCount"] = itemCount;
    j["total"] = {
        {"units", total.units},
        {"nano", total.nano},
        {"currency", total.currency}
    };
    return j.dump();
}

} // namespace placement::domain
