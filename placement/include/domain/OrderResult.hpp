#pragma once

#include "Order.hpp"

namespace placement::domain {

/**
 * @brief Результат размещения заказа
 *
 * duplicate = true, если заказ с этим ключом идемпотентности
 * уже существовал (повторный запрос или проигранная гонка).
 * Это не ошибка: клиент получает тот же заказ.
 */
struct PlaceOrderResult {
    Order order;
    bool duplicate = false;
};

} // namespace placement::domain
