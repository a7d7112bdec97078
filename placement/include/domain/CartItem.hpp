#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "Exceptions.hpp"
#include <string>

namespace placement::domain {

/**
 * @brief Позиция корзины (неизменяемое значение)
 *
 * Идентичность - itemId. Изменение количества создаёт новое значение
 * через withQuantity().
 */
struct CartItem {
    std::string itemId;         ///< UUID позиции
    std::string sku;            ///< Артикул товара
    std::string productName;    ///< Название товара
    int quantity = 1;           ///< Количество, >= 1
    Money unitPrice;            ///< Цена за единицу, >= 0
    Timestamp addedAt;          ///< Когда позиция появилась в корзине
    Timestamp updatedAt;        ///< Последнее изменение количества

    /**
     * @throws ValidationException при пустом sku/названии, quantity < 1, цене < 0
     *         или стоимости позиции вне диапазона Money
     */
    CartItem(
        const std::string& itemId,
        const std::string& sku,
        const std::string& productName,
        int quantity,
        const Money& unitPrice
    ) : itemId(itemId), sku(sku), productName(productName),
        quantity(quantity), unitPrice(unitPrice),
        addedAt(Timestamp::now()), updatedAt(addedAt)
    {
        if (itemId.empty()) {
            throw ValidationException("Item ID cannot be empty");
        }
        if (sku.empty()) {
            throw ValidationException("SKU cannot be empty");
        }
        if (productName.empty()) {
            throw ValidationException("Product name cannot be empty");
        }
        validateQuantity(quantity);
        if (unitPrice.isNegative()) {
            throw ValidationException("Unit price cannot be negative");
        }
        validateLineTotal(unitPrice, quantity);
    }

    /**
     * @brief Стоимость позиции: unitPrice * quantity
     */
    Money totalPrice() const {
        return unitPrice * quantity;
    }

    /**
     * @brief Копия с новым количеством и свежим updatedAt
     */
    CartItem withQuantity(int newQuantity) const {
        validateQuantity(newQuantity);
        validateLineTotal(unitPrice, newQuantity);
        CartItem copy = *this;
        copy.quantity = newQuantity;
        copy.updatedAt = Timestamp::now();
        return copy;
    }

    static void validateQuantity(int value) {
        if (value < 1) {
            throw ValidationException("Quantity must be at least 1, got " + std::to_string(value));
        }
    }

    static void validateLineTotal(const Money& price, int value) {
        try {
            (void)(price * value);
        } catch (const std::overflow_error&) {
            throw ValidationException("Line total out of range: " + price.toString() +
                                      " x " + std::to_string(value));
        }
    }
};

} // namespace placement::domain
