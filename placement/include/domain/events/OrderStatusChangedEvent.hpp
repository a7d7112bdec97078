#pragma once

#include "DomainEvent.hpp"
#include "domain/enums/OrderStatus.hpp"
#include <string>

namespace placement::domain {

/**
 * @brief Событие: статус заказа изменён
 */
struct OrderStatusChangedEvent : public DomainEvent {
    static constexpr const char* TYPE = "order.status_changed";

    std::string userId;
    OrderStatus previousStatus = OrderStatus::PENDING;
    OrderStatus newStatus = OrderStatus::PENDING;

    OrderStatusChangedEvent() : DomainEvent(TYPE) {}

    /// JSON конструктор для десериализации
    explicit OrderStatusChangedEvent(const std::string& json);

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<OrderStatusChangedEvent>(*this);
    }
};

} // namespace placement::domain
