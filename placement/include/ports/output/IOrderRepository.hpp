#pragma once

#include "domain/Order.hpp"
#include <string>
#include <optional>
#include <vector>

namespace placement::ports::output {

/**
 * @brief Интерфейс хранилища заказов
 *
 * Output Port. Три индекса: orderId, userId, idempotencyKey.
 */
class IOrderRepository {
public:
    virtual ~IOrderRepository() = default;

    /**
     * @brief Сохранить заказ, если ключ идемпотентности ещё свободен
     *
     * Атомарно занимает idempotencyKey. Победитель индексируется по
     * orderId и userId и возвращается. Проигравший получает уже
     * сохранённый заказ, кандидат отбрасывается.
     *
     * @return Заказ, связанный с ключом (сравните orderId с кандидатом)
     */
    virtual domain::Order saveIfAbsentByIdempotencyKey(const domain::Order& order) = 0;

    virtual std::optional<domain::Order> findById(const std::string& orderId) = 0;

    virtual std::optional<domain::Order> findByIdempotencyKey(const std::string& idempotencyKey) = 0;

    /**
     * @brief Заказы пользователя, новые первыми
     */
    virtual std::vector<domain::Order> findByUserId(const std::string& userId) = 0;

    virtual std::vector<domain::Order> findByStatus(domain::OrderStatus status) = 0;

    /**
     * @brief Заменить заказ на order.withStatus(newStatus)
     *
     * Переход не проверяется - это делает OrderLifecycle до вызова.
     *
     * @return Обновлённый заказ или nullopt, если заказа нет
     */
    virtual std::optional<domain::Order> updateStatus(
        const std::string& orderId,
        domain::OrderStatus newStatus
    ) = 0;

    /**
     * @brief Сменить статус, только если текущий равен expectedStatus
     *
     * @return Обновлённый заказ или nullopt (заказа нет или статус уже другой)
     */
    virtual std::optional<domain::Order> compareAndUpdateStatus(
        const std::string& orderId,
        domain::OrderStatus expectedStatus,
        domain::OrderStatus newStatus
    ) = 0;

    virtual bool existsById(const std::string& orderId) = 0;

    virtual bool existsByIdempotencyKey(const std::string& idempotencyKey) = 0;

    virtual size_t count() const = 0;
};

} // namespace placement::ports::output
