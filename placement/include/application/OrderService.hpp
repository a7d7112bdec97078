#pragma once

#include "ports/input/IOrderService.hpp"
#include "ports/input/ICartService.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "ports/output/ICartRepository.hpp"
#include "ports/output/IEventBus.hpp"
#include "settings/IPlacementSettings.hpp"
#include <memory>

namespace placement::application {

/**
 * @brief Сервис размещения заказов
 *
 * Реализует IOrderService, координирует работу между:
 * - ICartRepository (источник корзины)
 * - IOrderRepository (идемпотентное сохранение)
 * - ICartService (очистка корзины после размещения)
 * - IEventBus (order.placed, order.status_changed)
 *
 * Размещение:
 * 1. Ключ уже занят -> вернуть существующий заказ (duplicate)
 * 2. Снимок корзины; пустой снимок -> CartEmptyException
 *    (если ключ за это время не занял параллельный запрос)
 * 3. Order::fromCart() по снимку - цены фиксируются здесь
 * 4. saveIfAbsentByIdempotencyKey() - гонку за ключ выигрывает один
 * 5. Победитель очищает корзину (best effort) и публикует order.placed
 */
class OrderService : public ports::input::IOrderService {
public:
    OrderService(
        std::shared_ptr<ports::output::IOrderRepository> orderRepository,
        std::shared_ptr<ports::output::ICartRepository> cartRepository,
        std::shared_ptr<ports::input::ICartService> cartService,
        std::shared_ptr<ports::output::IEventBus> eventBus,
        std::shared_ptr<settings::IPlacementSettings> settings
    );

    domain::PlaceOrderResult placeOrder(
        const domain::PlaceOrderRequest& request,
        const std::string& correlationId
    ) override;

    std::optional<domain::Order> getOrder(const std::string& orderId) override;

    std::optional<domain::Order> getOrderByIdempotencyKey(const std::string& idempotencyKey) override;

    std::vector<domain::Order> getOrdersByUserId(const std::string& userId) override;

    std::vector<domain::Order> getOrdersByStatus(domain::OrderStatus status) override;

    domain::Order confirmOrder(
        const std::string& orderId,
        const std::string& correlationId
    ) override;

    domain::Order cancelOrder(
        const std::string& orderId,
        const std::string& correlationId
    ) override;

    domain::Order updateOrderStatus(
        const std::string& orderId,
        domain::OrderStatus newStatus,
        const std::string& correlationId
    ) override;

private:
    std::shared_ptr<ports::output::IOrderRepository> orderRepository_;
    std::shared_ptr<ports::output::ICartRepository> cartRepository_;
    std::shared_ptr<ports::input::ICartService> cartService_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;
    std::shared_ptr<settings::IPlacementSettings> settings_;

    void clearCartAfterPlacement(const std::string& cartId, const std::string& correlationId);

    void publishOrderPlaced(const domain::Order& order, const std::string& correlationId);

    void publishStatusChanged(
        const domain::Order& order,
        domain::OrderStatus previousStatus,
        const std::string& correlationId
    );
};

} // namespace placement::application
