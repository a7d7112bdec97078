#pragma once

#include "ports/output/ICartRepository.hpp"
#include "domain/Exceptions.hpp"
#include <ThreadSafeMap.hpp>
#include <iostream>

namespace placement::adapters::secondary {

/**
 * @brief In-memory реализация хранилища корзин
 *
 * carts_      : cartId -> Cart
 * userCarts_  : userId -> cartId (текущая корзина пользователя)
 *
 * Данные живут только в памяти процесса.
 */
class InMemoryCartRepository : public ports::output::ICartRepository {
public:
    std::shared_ptr<domain::Cart> save(const std::shared_ptr<domain::Cart>& cart) override {
        carts_.insert(cart->cartId(), cart);
        userCarts_.insert(cart->userId(), std::make_shared<std::string>(cart->cartId()));
        return cart;
    }

    std::shared_ptr<domain::Cart> findById(const std::string& cartId) override {
        return carts_.find(cartId);
    }

    std::shared_ptr<domain::Cart> findByUserId(const std::string& userId) override {
        auto cartId = userCarts_.find(userId);
        return cartId ? carts_.find(*cartId) : nullptr;
    }

    bool existsById(const std::string& cartId) override {
        return carts_.contains(cartId);
    }

    std::shared_ptr<domain::Cart> deleteById(const std::string& cartId) override {
        auto removed = carts_.remove(cartId);
        if (!removed) {
            return nullptr;
        }

        // Индекс мог уже переключиться на более новую корзину
        userCarts_.removeIf(removed->userId(),
            [&cartId](const std::string& current) { return current == cartId; });
        return removed;
    }

    std::shared_ptr<domain::Cart> updateWithVersionCheck(
        const std::string& cartId,
        int64_t expectedVersion,
        const ports::output::CartMutator& mutator
    ) override {
        // Корзина в хранилище не подменяется: держатели ссылок должны
        // продолжать работать с тем же агрегатом
        return carts_.computeIfPresent(cartId,
            [&](const std::shared_ptr<domain::Cart>& existing) {
                existing->mutateAtVersion(expectedVersion, mutator);
                return existing;
            });
    }

    std::vector<std::shared_ptr<domain::Cart>> findAll() override {
        return carts_.getAll();
    }

    size_t count() const override {
        return carts_.size();
    }

    /**
     * @brief Очистить хранилище
     */
    void clear() {
        carts_.clear();
        userCarts_.clear();
        std::cerr << "[InMemoryCartRepository] All carts cleared" << std::endl;
    }

private:
    ThreadSafeMap<std::string, domain::Cart> carts_;
    ThreadSafeMap<std::string, std::string> userCarts_;
};

} // namespace placement::adapters::secondary
