#pragma once

#include "CartItem.hpp"
#include "Money.hpp"
#include <string>

namespace placement::domain {

/**
 * @brief Позиция заказа
 *
 * Снимок позиции корзины в момент размещения заказа.
 * Цена фиксируется и больше не меняется.
 */
struct OrderItem {
    std::string itemId;
    std::string sku;
    std::string productName;
    int quantity = 0;
    Money unitPrice;
    Money totalPrice;   ///< unitPrice * quantity на момент размещения

    static OrderItem fromCartItem(const CartItem& cartItem) {
        OrderItem item;
        item.itemId = cartItem.itemId;
        item.sku = cartItem.sku;
        item.productName = cartItem.productName;
        item.quantity = cartItem.quantity;
        item.unitPrice = cartItem.unitPrice;
        item.totalPrice = cartItem.totalPrice();
        return item;
    }
};

} // namespace placement::domain
