#include "domain/events/DomainEvent.hpp"
#include "utils/UuidGenerator.hpp"

namespace placement::domain {

DomainEvent::DomainEvent()
    : eventId(utils::UuidGenerator::generate())
    , timestamp(Timestamp::now())
{}

DomainEvent::DomainEvent(const std::string& type)
    : eventId(utils::UuidGenerator::generate())
    , eventType(type)
    , timestamp(Timestamp::now())
{}

void DomainEvent::writeBase(nlohmann::json& j) const {
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["aggregateId"] = aggregateId;
    j["correlationId"] = correlationId;
    j["timestamp"] = timestamp.toString();
}

void DomainEvent::readBase(const nlohmann::json& j) {
    eventId = j.value("eventId", eventId);
    aggregateId = j.value("aggregateId", "");
    correlationId = j.value("correlationId", "");
    if (j.contains("timestamp")) {
        timestamp = Timestamp::fromString(j["timestamp"].get<std::string>());
    }
}

} // namespace placement::domain
