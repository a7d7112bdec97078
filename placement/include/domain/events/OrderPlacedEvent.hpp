#pragma once

#include "DomainEvent.hpp"
#include "domain/Money.hpp"
#include <string>

namespace placement::domain {

/**
 * @brief Событие: заказ размещён (только при первом сохранении по ключу)
 */
struct OrderPlacedEvent : public DomainEvent {
    static constexpr const char* TYPE = "order.placed";

    std::string userId;
    std::string cartId;
    std::string idempotencyKey;
    int64_t itemCount = 0;
    Money total;

    /// Default конструктор
    OrderPlacedEvent() : DomainEvent(TYPE) {}

    /// JSON конструктор для десериализации
    explicit OrderPlacedEvent(const std::string& json);

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<OrderPlacedEvent>(*this);
    }
};

} // namespace placement::domain
