#pragma once

#include "enums/OrderStatus.hpp"
#include "OrderItem.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <vector>

namespace placement::domain {

class Cart;

/**
 * @brief Заказ
 *
 * Неизменяемый снимок корзины на момент размещения.
 * Смена статуса создаёт новый экземпляр (withStatus), позиции и суммы
 * после создания не меняются никогда.
 *
 * total = subtotal + tax, tax = subtotal * taxRate.
 */
class Order {
public:
    /// Налоговая ставка по умолчанию (10%)
    static constexpr double DEFAULT_TAX_RATE = 0.10;

    /**
     * @throws ValidationException если нет позиций или пустые идентификаторы
     */
    Order(
        const std::string& orderId,
        const std::string& userId,
        const std::string& cartId,
        const std::string& idempotencyKey,
        std::vector<OrderItem> items,
        const Money& subtotal,
        const Money& tax,
        OrderStatus status,
        const std::string& shippingAddress,
        const std::string& notes,
        const Timestamp& createdAt,
        const Timestamp& updatedAt
    );

    /**
     * @brief Построить заказ в статусе PENDING из снимка корзины
     *
     * @param cart Снимок корзины (Cart::snapshot())
     * @param idempotencyKey Ключ идемпотентности запроса
     * @param shippingAddress Адрес доставки
     * @param notes Комментарий к заказу
     * @param taxRate Налоговая ставка (0.10 = 10%)
     */
    static Order fromCart(
        const Cart& cart,
        const std::string& idempotencyKey,
        const std::string& shippingAddress,
        const std::string& notes,
        double taxRate = DEFAULT_TAX_RATE
    );

    /**
     * @brief Копия с новым статусом и свежим updatedAt
     */
    Order withStatus(OrderStatus newStatus) const;

    const std::string& orderId() const { return orderId_; }
    const std::string& userId() const { return userId_; }
    const std::string& cartId() const { return cartId_; }
    const std::string& idempotencyKey() const { return idempotencyKey_; }
    const std::vector<OrderItem>& items() const { return items_; }
    const Money& subtotal() const { return subtotal_; }
    const Money& tax() const { return tax_; }
    const Money& total() const { return total_; }
    OrderStatus status() const { return status_; }
    const std::string& shippingAddress() const { return shippingAddress_; }
    const std::string& notes() const { return notes_; }
    const Timestamp& createdAt() const { return createdAt_; }
    const Timestamp& updatedAt() const { return updatedAt_; }

    /**
     * @brief Суммарное количество единиц товара
     */
    int64_t itemCount() const;

private:
    std::string orderId_;
    std::string userId_;
    std::string cartId_;
    std::string idempotencyKey_;
    std::vector<OrderItem> items_;
    Money subtotal_;
    Money tax_;
    Money total_;
    OrderStatus status_;
    std::string shippingAddress_;
    std::string notes_;
    Timestamp createdAt_;
    Timestamp updatedAt_;
};

} // namespace placement::domain
