#pragma once

#include "domain/Cart.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

namespace placement::ports::output {

/**
 * @brief Функция изменения корзины для updateWithVersionCheck
 *
 * Получает сохранённую корзину и меняет её на месте.
 */
using CartMutator = std::function<void(domain::Cart&)>;

/**
 * @brief Интерфейс хранилища корзин
 *
 * Output Port. Корзины хранятся по ссылке (shared_ptr): вызывающий,
 * получивший корзину, работает с тем же агрегатом, что и хранилище.
 * Отсутствие корзины - nullptr, а не ошибка.
 */
class ICartRepository {
public:
    virtual ~ICartRepository() = default;

    /**
     * @brief Сохранить корзину (upsert по cartId)
     *
     * Индекс userId -> cartId переключается на эту корзину:
     * у пользователя ровно одна "текущая" корзина.
     */
    virtual std::shared_ptr<domain::Cart> save(const std::shared_ptr<domain::Cart>& cart) = 0;

    virtual std::shared_ptr<domain::Cart> findById(const std::string& cartId) = 0;

    /**
     * @brief Текущая корзина пользователя
     */
    virtual std::shared_ptr<domain::Cart> findByUserId(const std::string& userId) = 0;

    virtual bool existsById(const std::string& cartId) = 0;

    /**
     * @brief Удалить корзину
     *
     * Запись индекса пользователя удаляется, только если она всё ещё
     * указывает на эту корзину.
     *
     * @return Удалённая корзина или nullptr
     */
    virtual std::shared_ptr<domain::Cart> deleteById(const std::string& cartId) = 0;

    /**
     * @brief Оптимистическое обновление
     *
     * Атомарно перечитывает корзину; если её версия не равна expectedVersion,
     * бросает VersionConflictException, не вызывая mutator.
     * Иначе применяет mutator к самой сохранённой корзине: ссылки,
     * полученные ранее через findById(), видят результат.
     *
     * @return Изменённая корзина или nullptr, если корзины нет
     * @throws domain::VersionConflictException
     */
    virtual std::shared_ptr<domain::Cart> updateWithVersionCheck(
        const std::string& cartId,
        int64_t expectedVersion,
        const CartMutator& mutator
    ) = 0;

    virtual std::vector<std::shared_ptr<domain::Cart>> findAll() = 0;

    virtual size_t count() const = 0;
};

} // namespace placement::ports::output
