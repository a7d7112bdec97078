#pragma once

#include "domain/Exceptions.hpp"
#include <string>

namespace placement::domain {

/**
 * @brief Статус заказа
 *
 * PENDING -> CONFIRMED -> PROCESSING -> SHIPPED -> DELIVERED
 * PENDING | CONFIRMED -> CANCELLED
 */
enum class OrderStatus {
    PENDING,     ///< Создан, ожидает подтверждения
    CONFIRMED,   ///< Подтверждён (оплата проверена)
    PROCESSING,  ///< Собирается к отправке
    SHIPPED,     ///< Передан в доставку
    DELIVERED,   ///< Доставлен покупателю
    CANCELLED    ///< Отменён
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING:    return "PENDING";
        case OrderStatus::CONFIRMED:  return "CONFIRMED";
        case OrderStatus::PROCESSING: return "PROCESSING";
        case OrderStatus::SHIPPED:    return "SHIPPED";
        case OrderStatus::DELIVERED:  return "DELIVERED";
        case OrderStatus::CANCELLED:  return "CANCELLED";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws ValidationException если строка не распознана
 */
inline OrderStatus orderStatusFromString(const std::string& str) {
    if (str == "PENDING")    return OrderStatus::PENDING;
    if (str == "CONFIRMED")  return OrderStatus::CONFIRMED;
    if (str == "PROCESSING") return OrderStatus::PROCESSING;
    if (str == "SHIPPED")    return OrderStatus::SHIPPED;
    if (str == "DELIVERED")  return OrderStatus::DELIVERED;
    if (str == "CANCELLED")  return OrderStatus::CANCELLED;
    throw ValidationException("Unknown OrderStatus: " + str);
}

/**
 * @brief Человекочитаемое описание статуса
 */
inline std::string describe(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING:    return "Order is pending confirmation";
        case OrderStatus::CONFIRMED:  return "Order has been confirmed";
        case OrderStatus::PROCESSING: return "Order is being processed";
        case OrderStatus::SHIPPED:    return "Order has been shipped";
        case OrderStatus::DELIVERED:  return "Order has been delivered";
        case OrderStatus::CANCELLED:  return "Order has been cancelled";
    }
    return "Unknown status";
}

/**
 * @brief Можно ли отменить заказ в данном статусе
 */
inline bool isCancellable(OrderStatus status) {
    return status == OrderStatus::PENDING || status == OrderStatus::CONFIRMED;
}

/**
 * @brief Является ли статус финальным (заказ больше не может измениться)
 */
inline bool isTerminal(OrderStatus status) {
    return status == OrderStatus::DELIVERED || status == OrderStatus::CANCELLED;
}

/**
 * @brief Можно ли ещё менять содержимое заказа
 */
inline bool isModifiable(OrderStatus status) {
    return status == OrderStatus::PENDING;
}

} // namespace placement::domain
