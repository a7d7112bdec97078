#include "domain/events/OrderStatusChangedEvent.hpp"
#include <nlohmann/json.hpp>

namespace placement::domain {

OrderStatusChangedEvent::OrderStatusChangedEvent(const std::string& json)
    : DomainEvent(TYPE)
{
    if (json.empty() || json == "{}") return;

    auto j = nlohmann::json::parse(json);
    readBase(j);

    userId = j.value("userId", "");
    if (j.contains("previousStatus")) {
        previousStatus = orderStatusFromString(j["previousStatus"].get<std::string>());
    }
    if (j.contains("newStatus")) {
        newStatus = orderStatusFromString(j["newStatus"].get<std::string>());
    }
}

std::string OrderStatusChangedEvent::toJson() const {
    nlohmann::json j;
    writeBase(j);
    j["userId"] = userId;
    j["previousStatus"] = toString(previousStatus);
    j["newStatus"] = toString(newStatus);
    return j.dump();
}

} // namespace placement::domain
