#pragma once

#include "Money.hpp"
#include <string>

namespace placement::domain {

/**
 * @brief Запрос на размещение заказа из корзины
 */
struct PlaceOrderRequest {
    std::string cartId;             ///< Корзина-источник
    std::string idempotencyKey;     ///< Ключ идемпотентности от клиента
    std::string shippingAddress;    ///< Адрес доставки
    std::string notes;              ///< Комментарий (может быть пустым)
};

/**
 * @brief Запрос на добавление товара в корзину
 */
struct AddItemRequest {
    std::string sku;
    std::string productName;
    int quantity = 1;
    Money unitPrice;
};

} // namespace placement::domain
