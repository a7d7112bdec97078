#pragma once

#include "CartItem.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <cstdint>

namespace placement::domain {

/**
 * @brief Корзина покупателя
 *
 * Изменяемый агрегат, разделяемый между потоками через shared_ptr.
 * Каждая операция атомарна относительно карты позиций и версии
 * (собственный мьютекс агрегата), но последовательность из двух вызовов
 * атомарной не является. Для read-modify-write используйте
 * mutateAtVersion() или ICartRepository::updateWithVersionCheck().
 *
 * Все позиции оцениваются в валюте корзины.
 *
 * Версия растёт ровно на 1 при каждом изменении позиций,
 * updatedAt обновляется вместе с ней.
 */
class Cart {
public:
    /**
     * @brief Новая пустая корзина пользователя (cartId генерируется)
     */
    Cart(const std::string& userId, const std::string& currency);

    /**
     * @brief Восстановить корзину из готовых полей
     */
    Cart(
        const std::string& cartId,
        const std::string& userId,
        const std::string& currency,
        std::map<std::string, CartItem> items,
        const Timestamp& createdAt,
        const Timestamp& updatedAt,
        int64_t version
    );

    /// Копия под блокировкой исходной корзины (основа snapshot())
    Cart(const Cart& other);
    Cart& operator=(const Cart&) = delete;

    const std::string& cartId() const { return cartId_; }
    const std::string& userId() const { return userId_; }
    const std::string& currency() const { return currency_; }
    const Timestamp& createdAt() const { return createdAt_; }
    Timestamp updatedAt() const;
    int64_t version() const;

    /**
     * @brief Копия карты позиций (itemId -> CartItem)
     */
    std::map<std::string, CartItem> items() const;

    std::optional<CartItem> getItem(const std::string& itemId) const;

    /**
     * @brief Найти позицию с заданным артикулом
     */
    std::optional<CartItem> findItemBySku(const std::string& sku) const;

    /**
     * @brief Добавить позицию
     *
     * Если под тем же itemId уже лежит позиция с тем же SKU,
     * количества складываются. Иначе позиция кладётся как есть.
     *
     * @return Итоговая сохранённая позиция
     * @throws ValidationException если цена не в валюте корзины
     *         или сумма количеств не помещается в int
     */
    CartItem addItem(const CartItem& item);

    /**
     * @brief Заменить количество позиции
     * @throws ItemNotFoundException если позиции нет
     * @throws ValidationException если quantity < 1
     */
    CartItem updateItemQuantity(const std::string& itemId, int quantity);

    /**
     * @brief Удалить позицию
     * @return Удалённая позиция или nullopt (версия при этом не меняется)
     */
    std::optional<CartItem> removeItem(const std::string& itemId);

    /**
     * @brief Очистить корзину (версия растёт всегда)
     */
    void clear();

    /**
     * @brief Изменить корзину, если её версия всё ещё expectedVersion
     *
     * Сравнение версии и mutation выполняются под мьютексом корзины,
     * поэтому между ними никто не вклинится. mutation может вызывать
     * обычные методы корзины. Если mutation бросает исключение,
     * позиции и версия откатываются к исходным.
     *
     * @throws VersionConflictException если версия уже другая
     */
    void mutateAtVersion(int64_t expectedVersion, const std::function<void(Cart&)>& mutation);

    Money totalPrice() const;

    /**
     * @brief Суммарное количество единиц товара (не число позиций)
     */
    int64_t itemCount() const;

    bool isEmpty() const;

    /**
     * @brief Независимая копия для построения заказа
     */
    Cart snapshot() const;

private:
    std::string cartId_;
    std::string userId_;
    std::string currency_;
    Timestamp createdAt_;

    // Рекурсивный: mutateAtVersion() вызывает методы корзины под своей блокировкой
    mutable std::recursive_mutex mutex_;
    std::map<std::string, CartItem> items_;
    Timestamp updatedAt_;
    int64_t version_ = 0;

    // Вызывать под mutex_
    void incrementVersion();
    void requireCurrency(const CartItem& item) const;
};

} // namespace placement::domain
