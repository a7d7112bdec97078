#include "application/CartService.hpp"
#include "domain/Exceptions.hpp"
#include "utils/UuidGenerator.hpp"
#include <iostream>

namespace placement::application {

CartService::CartService(
    std::shared_ptr<ports::output::ICartRepository> cartRepository,
    std::shared_ptr<ports::output::IEventBus> eventBus,
    std::shared_ptr<settings::IPlacementSettings> settings
) : cartRepository_(std::move(cartRepository))
  , eventBus_(std::move(eventBus))
  , settings_(std::move(settings))
{}

std::shared_ptr<domain::Cart> CartService::createCart(
    const std::string& userId,
    const std::string& correlationId
) {
    std::cout << "[CartService] Creating cart: userId=" << userId
              << ", correlationId=" << correlationId << std::endl;

    if (auto existing = cartRepository_->findByUserId(userId)) {
        std::cout << "[CartService] User already has cart, it will be superseded: existingCartId="
                  << existing->cartId() << std::endl;
    }

    auto cart = cartRepository_->save(
        std::make_shared<domain::Cart>(userId, settings_->getCurrency()));

    publishCartEvent(domain::CartEvent::CREATED, *cart, correlationId);

    std::cout << "[CartService] Cart created: cartId=" << cart->cartId()
              << ", userId=" << userId << std::endl;
    return cart;
}

std::shared_ptr<domain::Cart> CartService::getCart(const std::string& cartId) {
    return cartRepository_->findById(cartId);
}

std::shared_ptr<domain::Cart> CartService::getCartByUserId(const std::string& userId) {
    return cartRepository_->findByUserId(userId);
}

std::shared_ptr<domain::Cart> CartService::addItem(
    const std::string& cartId,
    const domain::AddItemRequest& request,
    const std::string& correlationId
) {
    std::cout << "[CartService] Adding item: cartId=" << cartId
              << ", sku=" << request.sku
              << ", quantity=" << request.quantity
              << ", unitPrice=" << request.unitPrice.toString()
              << ", correlationId=" << correlationId << std::endl;

    auto cart = requireCart(cartId);

    // Тот же SKU кладём под ключ существующей позиции - корзина сложит количества
    auto sameSku = cart->findItemBySku(request.sku);
    std::string itemId = sameSku ? sameSku->itemId : utils::UuidGenerator::generate();

    domain::CartItem item(itemId, request.sku, request.productName,
                          request.quantity, request.unitPrice);
    auto stored = cart->addItem(item);

    publishCartEvent(domain::CartEvent::ITEM_ADDED, *cart, correlationId, &stored);

    std::cout << "[CartService] Item added: cartId=" << cartId
              << ", itemId=" << stored.itemId
              << ", quantity=" << stored.quantity
              << ", cartTotal=" << cart->totalPrice().toString() << std::endl;
    return cart;
}

std::shared_ptr<domain::Cart> CartService::updateItemQuantity(
    const std::string& cartId,
    const std::string& itemId,
    int quantity,
    const std::string& correlationId
) {
    std::cout << "[CartService] Updating item quantity: cartId=" << cartId
              << ", itemId=" << itemId
              << ", quantity=" << quantity
              << ", correlationId=" << correlationId << std::endl;

    auto cart = requireCart(cartId);
    auto updated = cart->updateItemQuantity(itemId, quantity);

    publishCartEvent(domain::CartEvent::ITEM_UPDATED, *cart, correlationId, &updated);
    return cart;
}

std::shared_ptr<domain::Cart> CartService::updateItemQuantityWithVersion(
    const std::string& cartId,
    const std::string& itemId,
    int quantity,
    int64_t expectedVersion,
    const std::string& correlationId
) {
    std::cout << "[CartService] Updating item quantity with version check: cartId=" << cartId
              << ", itemId=" << itemId
              << ", quantity=" << quantity
              << ", expectedVersion=" << expectedVersion
              << ", correlationId=" << correlationId << std::endl;

    auto cart = cartRepository_->updateWithVersionCheck(cartId, expectedVersion,
        [&itemId, quantity](domain::Cart& current) {
            current.updateItemQuantity(itemId, quantity);
        });

    if (!cart) {
        throw domain::CartNotFoundException(cartId);
    }

    auto updated = cart->getItem(itemId);
    publishCartEvent(domain::CartEvent::ITEM_UPDATED, *cart, correlationId,
                     updated ? &*updated : nullptr);

    std::cout << "[CartService] Item quantity updated: cartId=" << cartId
              << ", version=" << cart->version() << std::endl;
    return cart;
}

std::shared_ptr<domain::Cart> CartService::removeItem(
    const std::string& cartId,
    const std::string& itemId,
    const std::string& correlationId
) {
    std::cout << "[CartService] Removing item: cartId=" << cartId
              << ", itemId=" << itemId
              << ", correlationId=" << correlationId << std::endl;

    auto cart = requireCart(cartId);
    auto removed = cart->removeItem(itemId);
    if (!removed) {
        throw domain::ItemNotFoundException(itemId, cartId);
    }

    publishCartEvent(domain::CartEvent::ITEM_REMOVED, *cart, correlationId, &*removed);
    return cart;
}

std::shared_ptr<domain::Cart> CartService::clearCart(
    const std::string& cartId,
    const std::string& correlationId
) {
    auto cart = requireCart(cartId);
    auto previousCount = cart->itemCount();
    cart->clear();

    publishCartEvent(domain::CartEvent::CLEARED, *cart, correlationId);

    std::cout << "[CartService] Cart cleared: cartId=" << cartId
              << ", itemsRemoved=" << previousCount
              << ", correlationId=" << correlationId << std::endl;
    return cart;
}

void CartService::deleteCart(
    const std::string& cartId,
    const std::string& correlationId
) {
    auto removed = cartRepository_->deleteById(cartId);
    if (!removed) {
        throw domain::CartNotFoundException(cartId);
    }

    publishCartEvent(domain::CartEvent::DELETED, *removed, correlationId);

    std::cout << "[CartService] Cart deleted: cartId=" << cartId
              << ", correlationId=" << correlationId << std::endl;
}

std::shared_ptr<domain::Cart> CartService::requireCart(const std::string& cartId) {
    auto cart = cartRepository_->findById(cartId);
    if (!cart) {
        throw domain::CartNotFoundException(cartId);
    }
    return cart;
}

void CartService::publishCartEvent(
    const char* eventType,
    const domain::Cart& cart,
    const std::string& correlationId,
    const domain::CartItem* item
) {
    domain::CartEvent event(eventType);
    event.aggregateId = cart.cartId();
    event.correlationId = correlationId;
    event.userId = cart.userId();
    event.version = cart.version();
    if (item) {
        event.itemId = item->itemId;
        event.sku = item->sku;
        event.quantity = item->quantity;
    }

    try {
        eventBus_->publish(event);
    } catch (const std::exception& e) {
        std::cerr << "[CartService] Failed to publish " << eventType
                  << ": cartId=" << cart.cartId()
                  << ", error=" << e.what() << std::endl;
    }
}

} // namespace placement::application
