#pragma once

#include "ports/output/IOrderRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <iostream>
#include <mutex>
#include <set>
#include <unordered_map>

namespace placement::adapters::secondary {

/**
 * @brief In-memory реализация хранилища заказов
 *
 * orders_      : orderId -> Order (актуальный статус)
 * placedByKey_ : idempotencyKey -> Order в момент размещения
 * userOrders_  : userId -> orderIds
 *
 * placedByKey_ хранит сам заказ, а не только его ID: проигравший гонку
 * поток сразу получает заказ победителя.
 *
 * Захват ключа и запись в orders_/userOrders_ выполняются под одной
 * блокировкой ключа в placedByKey_: кто видит ключ, тот видит и заказ
 * по его orderId.
 */
class InMemoryOrderRepository : public ports::output::IOrderRepository {
public:
    domain::Order saveIfAbsentByIdempotencyKey(const domain::Order& order) override {
        std::shared_ptr<domain::Order> existing;

        placedByKey_.compute(order.idempotencyKey(),
            [&](const std::shared_ptr<domain::Order>& current) {
                if (current) {
                    existing = current;
                    return current;
                }

                auto candidate = std::make_shared<domain::Order>(order);
                orders_.insert(order.orderId(), candidate);
                std::lock_guard<std::mutex> lock(indexMutex_);
                userOrders_[order.userId()].insert(order.orderId());
                return candidate;
            });

        if (existing) {
            std::cout << "[InMemoryOrderRepository] Idempotency key already used: key="
                      << order.idempotencyKey()
                      << ", existingOrderId=" << existing->orderId() << std::endl;
            return latest(*existing);
        }
        return order;
    }

    std::optional<domain::Order> findById(const std::string& orderId) override {
        auto order = orders_.find(orderId);
        return order ? std::optional(*order) : std::nullopt;
    }

    std::optional<domain::Order> findByIdempotencyKey(const std::string& idempotencyKey) override {
        auto placed = placedByKey_.find(idempotencyKey);
        return placed ? std::optional(latest(*placed)) : std::nullopt;
    }

    std::vector<domain::Order> findByUserId(const std::string& userId) override {
        std::set<std::string> orderIds;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = userOrders_.find(userId);
            if (it != userOrders_.end()) {
                orderIds = it->second;
            }
        }

        std::vector<domain::Order> result;
        for (const auto& id : orderIds) {
            if (auto order = orders_.find(id)) {
                result.push_back(*order);
            }
        }

        sortNewestFirst(result);
        return result;
    }

    std::vector<domain::Order> findByStatus(domain::OrderStatus status) override {
        std::vector<domain::Order> result;
        for (const auto& order : orders_.getAll()) {
            if (order->status() == status) {
                result.push_back(*order);
            }
        }

        sortNewestFirst(result);
        return result;
    }

    std::optional<domain::Order> updateStatus(
        const std::string& orderId,
        domain::OrderStatus newStatus
    ) override {
        auto updated = orders_.computeIfPresent(orderId,
            [newStatus](const std::shared_ptr<domain::Order>& existing) {
                return std::make_shared<domain::Order>(existing->withStatus(newStatus));
            });
        return updated ? std::optional(*updated) : std::nullopt;
    }

    std::optional<domain::Order> compareAndUpdateStatus(
        const std::string& orderId,
        domain::OrderStatus expectedStatus,
        domain::OrderStatus newStatus
    ) override {
        bool applied = false;
        auto current = orders_.computeIfPresent(orderId,
            [&](const std::shared_ptr<domain::Order>& existing) {
                if (existing->status() != expectedStatus) {
                    return existing;
                }
                applied = true;
                return std::make_shared<domain::Order>(existing->withStatus(newStatus));
            });
        return (current && applied) ? std::optional(*current) : std::nullopt;
    }

    bool existsById(const std::string& orderId) override {
        return orders_.contains(orderId);
    }

    bool existsByIdempotencyKey(const std::string& idempotencyKey) override {
        return placedByKey_.contains(idempotencyKey);
    }

    size_t count() const override {
        return orders_.size();
    }

    /**
     * @brief Очистить хранилище
     */
    void clear() {
        orders_.clear();
        placedByKey_.clear();
        std::lock_guard<std::mutex> lock(indexMutex_);
        userOrders_.clear();
        std::cerr << "[InMemoryOrderRepository] All orders cleared" << std::endl;
    }

private:
    ThreadSafeMap<std::string, domain::Order> orders_;
    ThreadSafeMap<std::string, domain::Order> placedByKey_;
    mutable std::mutex indexMutex_;
    std::unordered_map<std::string, std::set<std::string>> userOrders_; // userId -> orderIds

    /// Актуальная версия заказа (статус мог смениться после размещения)
    domain::Order latest(const domain::Order& placed) const {
        auto stored = orders_.find(placed.orderId());
        return stored ? *stored : placed;
    }

    static void sortNewestFirst(std::vector<domain::Order>& orders) {
        std::sort(orders.begin(), orders.end(),
            [](const domain::Order& a, const domain::Order& b) {
                return a.createdAt() > b.createdAt();
            });
    }
};

} // namespace placement::adapters::secondary
