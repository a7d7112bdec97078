#include "application/OrderService.hpp"
#include "domain/OrderLifecycle.hpp"
#include "domain/Exceptions.hpp"
#include "domain/Cart.hpp"
#include "domain/events/OrderPlacedEvent.hpp"
#include "domain/events/OrderStatusChangedEvent.hpp"
#include <iostream>

namespace placement::application {

OrderService::OrderService(
    std::shared_ptr<ports::output::IOrderRepository> orderRepository,
    std::shared_ptr<ports::output::ICartRepository> cartRepository,
    std::shared_ptr<ports::input::ICartService> cartService,
    std::shared_ptr<ports::output::IEventBus> eventBus,
    std::shared_ptr<settings::IPlacementSettings> settings
) : orderRepository_(std::move(orderRepository))
  , cartRepository_(std::move(cartRepository))
  , cartService_(std::move(cartService))
  , eventBus_(std::move(eventBus))
  , settings_(std::move(settings))
{}

domain::PlaceOrderResult OrderService::placeOrder(
    const domain::PlaceOrderRequest& request,
    const std::string& correlationId
) {
    std::cout << "[OrderService] Placing order: cartId=" << request.cartId
              << ", idempotencyKey=" << request.idempotencyKey
              << ", correlationId=" << correlationId << std::endl;

    if (request.idempotencyKey.empty()) {
        throw domain::ValidationException("Idempotency key is required");
    }

    if (auto existing = orderRepository_->findByIdempotencyKey(request.idempotencyKey)) {
        std::cout << "[OrderService] Duplicate request: idempotencyKey=" << request.idempotencyKey
                  << ", orderId=" << existing->orderId() << std::endl;
        return domain::PlaceOrderResult{*existing, true};
    }

    auto cart = cartRepository_->findById(request.cartId);
    if (!cart) {
        throw domain::CartNotFoundException(request.cartId);
    }

    // Дальше работаем только со снимком: параллельные правки корзины его не меняют
    auto snapshot = cart->snapshot();
    if (snapshot.isEmpty()) {
        // Параллельный запрос с тем же ключом мог уже разместить заказ и очистить корзину
        if (auto existing = orderRepository_->findByIdempotencyKey(request.idempotencyKey)) {
            std::cout << "[OrderService] Cart already drained by concurrent request: idempotencyKey="
                      << request.idempotencyKey << ", orderId=" << existing->orderId() << std::endl;
            return domain::PlaceOrderResult{*existing, true};
        }
        throw domain::CartEmptyException(request.cartId);
    }

    auto candidate = domain::Order::fromCart(
        snapshot,
        request.idempotencyKey,
        request.shippingAddress,
        request.notes,
        settings_->getTaxRate()
    );

    auto saved = orderRepository_->saveIfAbsentByIdempotencyKey(candidate);
    if (saved.orderId() != candidate.orderId()) {
        std::cout << "[OrderService] Lost idempotency race: idempotencyKey=" << request.idempotencyKey
                  << ", orderId=" << saved.orderId() << std::endl;
        return domain::PlaceOrderResult{saved, true};
    }

    clearCartAfterPlacement(snapshot.cartId(), correlationId);
    publishOrderPlaced(saved, correlationId);

    std::cout << "[OrderService] Order placed: orderId=" << saved.orderId()
              << ", userId=" << saved.userId()
              << ", items=" << saved.itemCount()
              << ", subtotal=" << saved.subtotal().toString()
              << ", tax=" << saved.tax().toString()
              << ", total=" << saved.total().toString() << std::endl;

    return domain::PlaceOrderResult{saved, false};
}

std::optional<domain::Order> OrderService::getOrder(const std::string& orderId) {
    return orderRepository_->findById(orderId);
}

std::optional<domain::Order> OrderService::getOrderByIdempotencyKey(const std::string& idempotencyKey) {
    return orderRepository_->findByIdempotencyKey(idempotencyKey);
}

std::vector<domain::Order> OrderService::getOrdersByUserId(const std::string& userId) {
    return orderRepository_->findByUserId(userId);
}

std::vector<domain::Order> OrderService::getOrdersByStatus(domain::OrderStatus status) {
    return orderRepository_->findByStatus(status);
}

domain::Order OrderService::confirmOrder(
    const std::string& orderId,
    const std::string& correlationId
) {
    return updateOrderStatus(orderId, domain::OrderStatus::CONFIRMED, correlationId);
}

domain::Order OrderService::cancelOrder(
    const std::string& orderId,
    const std::string& correlationId
) {
    return updateOrderStatus(orderId, domain::OrderStatus::CANCELLED, correlationId);
}

domain::Order OrderService::updateOrderStatus(
    const std::string& orderId,
    domain::OrderStatus newStatus,
    const std::string& correlationId
) {
    std::cout << "[OrderService] Updating status: orderId=" << orderId
              << ", newStatus=" << domain::toString(newStatus)
              << ", correlationId=" << correlationId << std::endl;

    // Статус мог смениться между чтением и записью - перечитываем и проверяем заново.
    // Цикл конечен: каждый успешный чужой переход двигает заказ вперёд по графу.
    while (true) {
        auto current = orderRepository_->findById(orderId);
        if (!current) {
            throw domain::OrderNotFoundException(orderId);
        }

        auto previousStatus = current->status();
        domain::OrderLifecycle::validateTransition(previousStatus, newStatus);

        auto updated = orderRepository_->compareAndUpdateStatus(orderId, previousStatus, newStatus);
        if (updated) {
            publishStatusChanged(*updated, previousStatus, correlationId);

            std::cout << "[OrderService] Status updated: orderId=" << orderId
                      << ", " << domain::toString(previousStatus)
                      << " -> " << domain::toString(newStatus) << std::endl;
            return *updated;
        }
    }
}

void OrderService::clearCartAfterPlacement(
    const std::string& cartId,
    const std::string& correlationId
) {
    // Заказ уже сохранён - сбой очистки не отменяет размещение
    try {
        cartService_->clearCart(cartId, correlationId);
    } catch (const std::exception& e) {
        std::cerr << "[OrderService] Failed to clear cart after placement: cartId=" << cartId
                  << ", error=" << e.what() << std::endl;
    }
}

void OrderService::publishOrderPlaced(
    const domain::Order& order,
    const std::string& correlationId
) {
    domain::OrderPlacedEvent event;
    event.aggregateId = order.orderId();
    event.correlationId = correlationId;
    event.userId = order.userId();
    event.cartId = order.cartId();
    event.idempotencyKey = order.idempotencyKey();
    event.itemCount = order.itemCount();
    event.total = order.total();

    try {
        eventBus_->publish(event);
    } catch (const std::exception& e) {
        std::cerr << "[OrderService] Failed to publish " << domain::OrderPlacedEvent::TYPE
                  << ": orderId=" << order.orderId()
                  << ", error=" << e.what() << std::endl;
    }
}

void OrderService::publishStatusChanged(
    const domain::Order& order,
    domain::OrderStatus previousStatus,
    const std::string& correlationId
) {
    domain::OrderStatusChangedEvent event;
    event.aggregateId = order.orderId();
    event.correlationId = correlationId;
    event.userId = order.userId();
    event.previousStatus = previousStatus;
    event.newStatus = order.status();

    try {
        eventBus_->publish(event);
    } catch (const std::exception& e) {
        std::cerr << "[OrderService] Failed to publish " << domain::OrderStatusChangedEvent::TYPE
                  << ": orderId=" << order.orderId()
                  << ", error=" << e.what() << std::endl;
    }
}

} // namespace placement::application
