#pragma once

#include "domain/Cart.hpp"
#include "domain/OrderRequest.hpp"
#include <memory>
#include <string>
#include <cstdint>

namespace placement::ports::input {

/**
 * @brief Интерфейс сервиса корзин
 *
 * Input Port. Каждая изменяющая операция принимает correlationId
 * вызывающей стороны и публикует CartEvent.
 */
class ICartService {
public:
    virtual ~ICartService() = default;

    /**
     * @brief Создать пустую корзину пользователя
     *
     * Предыдущая корзина пользователя не удаляется, но перестаёт
     * быть текущей.
     */
    virtual std::shared_ptr<domain::Cart> createCart(
        const std::string& userId,
        const std::string& correlationId
    ) = 0;

    /**
     * @return Корзина или nullptr
     */
    virtual std::shared_ptr<domain::Cart> getCart(const std::string& cartId) = 0;

    /**
     * @return Текущая корзина пользователя или nullptr
     */
    virtual std::shared_ptr<domain::Cart> getCartByUserId(const std::string& userId) = 0;

    /**
     * @brief Добавить товар
     *
     * Товар с уже имеющимся в корзине SKU добавляется к существующей
     * позиции (количества складываются).
     *
     * @throws domain::CartNotFoundException
     * @throws domain::ValidationException
     */
    virtual std::shared_ptr<domain::Cart> addItem(
        const std::string& cartId,
        const domain::AddItemRequest& request,
        const std::string& correlationId
    ) = 0;

    /**
     * @throws domain::CartNotFoundException
     * @throws domain::ItemNotFoundException
     * @throws domain::ValidationException
     */
    virtual std::shared_ptr<domain::Cart> updateItemQuantity(
        const std::string& cartId,
        const std::string& itemId,
        int quantity,
        const std::string& correlationId
    ) = 0;

    /**
     * @brief Изменить количество, если корзина не менялась с expectedVersion
     *
     * @throws domain::VersionConflictException если корзину успели изменить
     * @throws domain::CartNotFoundException
     * @throws domain::ItemNotFoundException
     */
    virtual std::shared_ptr<domain::Cart> updateItemQuantityWithVersion(
        const std::string& cartId,
        const std::string& itemId,
        int quantity,
        int64_t expectedVersion,
        const std::string& correlationId
    ) = 0;

    /**
     * @throws domain::CartNotFoundException
     * @throws domain::ItemNotFoundException
     */
    virtual std::shared_ptr<domain::Cart> removeItem(
        const std::string& cartId,
        const std::string& itemId,
        const std::string& correlationId
    ) = 0;

    /**
     * @throws domain::CartNotFoundException
     */
    virtual std::shared_ptr<domain::Cart> clearCart(
        const std::string& cartId,
        const std::string& correlationId
    ) = 0;

    /**
     * @throws domain::CartNotFoundException
     */
    virtual void deleteCart(
        const std::string& cartId,
        const std::string& correlationId
    ) = 0;
};

} // namespace placement::ports::input
