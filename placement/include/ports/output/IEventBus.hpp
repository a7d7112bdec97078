#pragma once

#include "domain/events/DomainEvent.hpp"
#include <string>
#include <functional>

namespace placement::ports::output {

/**
 * @brief Callback для обработчиков событий
 */
using EventHandler = std::function<void(const domain::DomainEvent&)>;

/**
 * @brief Интерфейс событийной шины
 *
 * Output Port для публикации доменных событий внешним потребителям
 * (уведомления, аудит, аналитика). Сервисы публикуют fire-and-forget:
 * исключение из publish() логируется и не влияет на состояние.
 */
class IEventBus {
public:
    /// Подписка на все типы событий
    static constexpr const char* ALL_EVENTS = "*";

    virtual ~IEventBus() = default;

    /**
     * @brief Опубликовать событие
     */
    virtual void publish(const domain::DomainEvent& event) = 0;

    /**
     * @brief Подписаться на тип события
     *
     * @param eventType Тип события (например, "order.placed") или "*"
     * @param handler Функция-обработчик
     */
    virtual void subscribe(const std::string& eventType, EventHandler handler) = 0;

    /**
     * @brief Отписаться от типа события (удаляет ВСЕ handlers)
     */
    virtual void unsubscribe(const std::string& eventType) = 0;

    virtual bool hasSubscribers(const std::string& eventType) const = 0;
};

} // namespace placement::ports::output
