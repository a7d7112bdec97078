#pragma once

#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <memory>

namespace placement::domain {

/**
 * @brief Базовый класс для всех доменных событий
 *
 * Публикуется в IEventBus после каждой изменяющей операции.
 * Публикация fire-and-forget: ошибка доставки не влияет на состояние.
 */
struct DomainEvent {
    std::string eventId;        ///< UUID события
    std::string eventType;      ///< Тип события (cart.created, order.placed)
    std::string aggregateId;    ///< ID корзины или заказа
    std::string correlationId;  ///< Correlation id запроса вызывающей стороны
    Timestamp timestamp;        ///< Время создания события

    DomainEvent();

    explicit DomainEvent(const std::string& type);

    virtual ~DomainEvent() = default;

    /**
     * @brief Сериализовать в JSON
     */
    virtual std::string toJson() const = 0;

    /**
     * @brief Клонировать событие
     */
    virtual std::unique_ptr<DomainEvent> clone() const = 0;

protected:
    /// Записать общие поля события
    void writeBase(nlohmann::json& j) const;

    /// Прочитать общие поля события (eventType не трогает)
    void readBase(const nlohmann::json& j);
};

} // namespace placement::domain
