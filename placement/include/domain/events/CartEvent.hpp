#pragma once

#include "DomainEvent.hpp"
#include <string>
#include <cstdint>

namespace placement::domain {

/**
 * @brief Событие изменения корзины
 *
 * Один тип структуры на все изменения корзины, различаются eventType.
 * Поля позиции (itemId, sku, quantity) пусты для cart.created,
 * cart.cleared и cart.deleted.
 */
struct CartEvent : public DomainEvent {
    static constexpr const char* CREATED = "cart.created";
    static constexpr const char* ITEM_ADDED = "cart.item_added";
    static constexpr const char* ITEM_UPDATED = "cart.item_updated";
    static constexpr const char* ITEM_REMOVED = "cart.item_removed";
    static constexpr const char* CLEARED = "cart.cleared";
    static constexpr const char* DELETED = "cart.deleted";

    std::string userId;
    std::string itemId;
    std::string sku;
    int quantity = 0;
    int64_t version = 0;    ///< Версия корзины после изменения

    explicit CartEvent(const std::string& type) : DomainEvent(type) {}

    /// Десериализация из JSON (eventType берётся из сообщения)
    static CartEvent fromJson(const std::string& json);

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<CartEvent>(*this);
    }
};

} // namespace placement::domain
