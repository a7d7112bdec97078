#pragma once

#include "domain/Order.hpp"
#include "domain/OrderRequest.hpp"
#include "domain/OrderResult.hpp"
#include <string>
#include <vector>
#include <optional>

namespace placement::ports::input {

/**
 * @brief Интерфейс сервиса заказов
 *
 * Input Port для размещения заказов и управления их статусом.
 */
class IOrderService {
public:
    virtual ~IOrderService() = default;

    /**
     * @brief Разместить заказ из корзины (идемпотентно)
     *
     * Повтор с тем же ключом возвращает тот же заказ с duplicate = true.
     *
     * @throws domain::CartNotFoundException
     * @throws domain::CartEmptyException
     * @note Публикует order.placed только при первом размещении
     */
    virtual domain::PlaceOrderResult placeOrder(
        const domain::PlaceOrderRequest& request,
        const std::string& correlationId
    ) = 0;

    virtual std::optional<domain::Order> getOrder(const std::string& orderId) = 0;

    virtual std::optional<domain::Order> getOrderByIdempotencyKey(const std::string& idempotencyKey) = 0;

    virtual std::vector<domain::Order> getOrdersByUserId(const std::string& userId) = 0;

    virtual std::vector<domain::Order> getOrdersByStatus(domain::OrderStatus status) = 0;

    /**
     * @brief PENDING -> CONFIRMED
     * @throws domain::OrderNotFoundException
     * @throws domain::InvalidTransitionException
     */
    virtual domain::Order confirmOrder(
        const std::string& orderId,
        const std::string& correlationId
    ) = 0;

    /**
     * @brief PENDING | CONFIRMED -> CANCELLED
     * @throws domain::OrderNotFoundException
     * @throws domain::InvalidTransitionException
     */
    virtual domain::Order cancelOrder(
        const std::string& orderId,
        const std::string& correlationId
    ) = 0;

    /**
     * @brief Перевести заказ в произвольный статус по правилам OrderLifecycle
     * @throws domain::OrderNotFoundException
     * @throws domain::InvalidTransitionException
     */
    virtual domain::Order updateOrderStatus(
        const std::string& orderId,
        domain::OrderStatus newStatus,
        const std::string& correlationId
    ) = 0;
};

} // namespace placement::ports::input
