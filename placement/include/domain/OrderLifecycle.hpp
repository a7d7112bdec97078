#pragma once

#include "enums/OrderStatus.hpp"
#include "Exceptions.hpp"
#include <vector>

namespace placement::domain {

/**
 * @brief Машина состояний заказа
 *
 * PENDING -> CONFIRMED -> PROCESSING -> SHIPPED -> DELIVERED
 * PENDING | CONFIRMED -> CANCELLED
 *
 * DELIVERED и CANCELLED - финальные. Любая другая пара недопустима.
 */
class OrderLifecycle {
public:
    /**
     * @brief Разрешён ли переход current -> requested
     */
    static bool canTransition(OrderStatus current, OrderStatus requested) {
        switch (requested) {
            case OrderStatus::CONFIRMED:  return current == OrderStatus::PENDING;
            case OrderStatus::PROCESSING: return current == OrderStatus::CONFIRMED;
            case OrderStatus::SHIPPED:    return current == OrderStatus::PROCESSING;
            case OrderStatus::DELIVERED:  return current == OrderStatus::SHIPPED;
            case OrderStatus::CANCELLED:  return isCancellable(current);
            case OrderStatus::PENDING:    return false;
        }
        return false;
    }

    /**
     * @throws InvalidTransitionException если переход недопустим
     */
    static void validateTransition(OrderStatus current, OrderStatus requested) {
        if (!canTransition(current, requested)) {
            throw InvalidTransitionException(toString(current), toString(requested));
        }
    }

    /**
     * @brief Все статусы, в которые можно перейти из current
     */
    static std::vector<OrderStatus> allowedTransitions(OrderStatus current) {
        static const OrderStatus all[] = {
            OrderStatus::PENDING, OrderStatus::CONFIRMED, OrderStatus::PROCESSING,
            OrderStatus::SHIPPED, OrderStatus::DELIVERED, OrderStatus::CANCELLED
        };

        std::vector<OrderStatus> result;
        for (auto candidate : all) {
            if (canTransition(current, candidate)) {
                result.push_back(candidate);
            }
        }
        return result;
    }
};

} // namespace placement::domain
