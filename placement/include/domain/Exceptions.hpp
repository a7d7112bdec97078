#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

/**
 * @file Exceptions.hpp
 * @brief Доменные исключения размещения заказов
 *
 * Все ошибки восстановимы: вызывающий слой сам решает,
 * как их отобразить (404, 400, 409) и нужен ли повтор.
 */

namespace placement::domain {

/**
 * @brief Код ошибки для отображения во внешний протокол
 */
enum class ErrorCode {
    CART_NOT_FOUND,
    ITEM_NOT_FOUND,
    ORDER_NOT_FOUND,
    CART_EMPTY,
    INVALID_TRANSITION,
    VERSION_CONFLICT,
    VALIDATION_ERROR
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::CART_NOT_FOUND:     return "CART_NOT_FOUND";
        case ErrorCode::ITEM_NOT_FOUND:     return "ITEM_NOT_FOUND";
        case ErrorCode::ORDER_NOT_FOUND:    return "ORDER_NOT_FOUND";
        case ErrorCode::CART_EMPTY:         return "CART_EMPTY";
        case ErrorCode::INVALID_TRANSITION: return "INVALID_TRANSITION";
        case ErrorCode::VERSION_CONFLICT:   return "VERSION_CONFLICT";
        case ErrorCode::VALIDATION_ERROR:   return "VALIDATION_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Базовое исключение домена
 */
class PlacementException : public std::runtime_error {
public:
    PlacementException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class CartNotFoundException : public PlacementException {
public:
    explicit CartNotFoundException(const std::string& cartId)
        : PlacementException(ErrorCode::CART_NOT_FOUND, "Cart not found: " + cartId)
        , cartId_(cartId) {}

    const std::string& cartId() const { return cartId_; }

private:
    std::string cartId_;
};

class ItemNotFoundException : public PlacementException {
public:
    ItemNotFoundException(const std::string& itemId, const std::string& cartId)
        : PlacementException(ErrorCode::ITEM_NOT_FOUND,
                             "Item not found: " + itemId + " in cart " + cartId)
        , itemId_(itemId)
        , cartId_(cartId) {}

    const std::string& itemId() const { return itemId_; }
    const std::string& cartId() const { return cartId_; }

private:
    std::string itemId_;
    std::string cartId_;
};

class OrderNotFoundException : public PlacementException {
public:
    explicit OrderNotFoundException(const std::string& orderId)
        : PlacementException(ErrorCode::ORDER_NOT_FOUND, "Order not found: " + orderId)
        , orderId_(orderId) {}

    const std::string& orderId() const { return orderId_; }

private:
    std::string orderId_;
};

class CartEmptyException : public PlacementException {
public:
    explicit CartEmptyException(const std::string& cartId)
        : PlacementException(ErrorCode::CART_EMPTY,
                             "Cannot place order from empty cart: " + cartId)
        , cartId_(cartId) {}

    const std::string& cartId() const { return cartId_; }

private:
    std::string cartId_;
};

/**
 * @brief Недопустимый переход статуса заказа
 *
 * Статусы передаются строками, чтобы не тянуть сюда OrderStatus.
 */
class InvalidTransitionException : public PlacementException {
public:
    InvalidTransitionException(const std::string& from, const std::string& to)
        : PlacementException(ErrorCode::INVALID_TRANSITION,
                             "Invalid status transition: " + from + " -> " + to)
        , from_(from)
        , to_(to) {}

    const std::string& from() const { return from_; }
    const std::string& to() const { return to_; }

private:
    std::string from_;
    std::string to_;
};

/**
 * @brief Корзина изменена параллельным запросом (оптимистическая блокировка)
 *
 * Вызывающий должен перечитать корзину и повторить операцию.
 */
class VersionConflictException : public PlacementException {
public:
    VersionConflictException(const std::string& cartId, int64_t expected, int64_t actual)
        : PlacementException(ErrorCode::VERSION_CONFLICT,
                             "Cart was modified by another request: " + cartId +
                             ", expected version " + std::to_string(expected) +
                             ", actual " + std::to_string(actual))
        , cartId_(cartId)
        , expectedVersion_(expected)
        , actualVersion_(actual) {}

    const std::string& cartId() const { return cartId_; }
    int64_t expectedVersion() const { return expectedVersion_; }
    int64_t actualVersion() const { return actualVersion_; }

private:
    std::string cartId_;
    int64_t expectedVersion_;
    int64_t actualVersion_;
};

class ValidationException : public PlacementException {
public:
    explicit ValidationException(const std::string& message)
        : PlacementException(ErrorCode::VALIDATION_ERROR, message) {}
};

} // namespace placement::domain
