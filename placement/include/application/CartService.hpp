#pragma once

#include "ports/input/ICartService.hpp"
#include "ports/output/ICartRepository.hpp"
#include "ports/output/IEventBus.hpp"
#include "settings/IPlacementSettings.hpp"
#include "domain/events/CartEvent.hpp"
#include <memory>

namespace placement::application {

/**
 * @brief Сервис управления корзинами
 *
 * Реализует ICartService, координирует работу между:
 * - ICartRepository (хранение корзин)
 * - IEventBus (публикация CartEvent)
 *
 * Изменения позиций выполняются методами самой корзины (каждый атомарен).
 * Для изменения с проверкой версии используется
 * ICartRepository::updateWithVersionCheck().
 */
class CartService : public ports::input::ICartService {
public:
    CartService(
        std::shared_ptr<ports::output::ICartRepository> cartRepository,
        std::shared_ptr<ports::output::IEventBus> eventBus,
        std::shared_ptr<settings::IPlacementSettings> settings
    );

    std::shared_ptr<domain::Cart> createCart(
        const std::string& userId,
        const std::string& correlationId
    ) override;

    std::shared_ptr<domain::Cart> getCart(const std::string& cartId) override;

    std::shared_ptr<domain::Cart> getCartByUserId(const std::string& userId) override;

    std::shared_ptr<domain::Cart> addItem(
        const std::string& cartId,
        const domain::AddItemRequest& request,
        const std::string& correlationId
    ) override;

    std::shared_ptr<domain::Cart> updateItemQuantity(
        const std::string& cartId,
        const std::string& itemId,
        int quantity,
        const std::string& correlationId
    ) override;

    std::shared_ptr<domain::Cart> updateItemQuantityWithVersion(
        const std::string& cartId,
        const std::string& itemId,
        int quantity,
        int64_t expectedVersion,
        const std::string& correlationId
    ) override;

    std::shared_ptr<domain::Cart> removeItem(
        const std::string& cartId,
        const std::string& itemId,
        const std::string& correlationId
    ) override;

    std::shared_ptr<domain::Cart> clearCart(
        const std::string& cartId,
        const std::string& correlationId
    ) override;

    void deleteCart(
        const std::string& cartId,
        const std::string& correlationId
    ) override;

private:
    std::shared_ptr<ports::output::ICartRepository> cartRepository_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;
    std::shared_ptr<settings::IPlacementSettings> settings_;

    /// @throws domain::CartNotFoundException
    std::shared_ptr<domain::Cart> requireCart(const std::string& cartId);

    void publishCartEvent(
        const char* eventType,
        const domain::Cart& cart,
        const std::string& correlationId,
        const domain::CartItem* item = nullptr
    );
};

} // namespace placement::application
