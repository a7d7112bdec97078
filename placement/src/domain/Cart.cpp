#include "domain/Cart.hpp"
#include "domain/Exceptions.hpp"
#include "utils/UuidGenerator.hpp"
#include <limits>

namespace placement::domain {

Cart::Cart(const std::string& userId, const std::string& currency)
    : cartId_(utils::UuidGenerator::generate())
    , userId_(userId)
    , currency_(currency)
    , createdAt_(Timestamp::now())
    , updatedAt_(createdAt_)
{
    if (userId_.empty()) {
        throw ValidationException("User ID cannot be empty");
    }
}

Cart::Cart(
    const std::string& cartId,
    const std::string& userId,
    const std::string& currency,
    std::map<std::string, CartItem> items,
    const Timestamp& createdAt,
    const Timestamp& updatedAt,
    int64_t version
) : cartId_(cartId)
  , userId_(userId)
  , currency_(currency)
  , createdAt_(createdAt)
  , items_(std::move(items))
  , updatedAt_(updatedAt)
  , version_(version)
{
    for (const auto& [itemId, item] : items_) {
        requireCurrency(item);
    }
}

Cart::Cart(const Cart& other)
    : cartId_(other.cartId_)
    , userId_(other.userId_)
    , currency_(other.currency_)
    , createdAt_(other.createdAt_)
{
    std::lock_guard<std::recursive_mutex> lock(other.mutex_);
    items_ = other.items_;
    updatedAt_ = other.updatedAt_;
    version_ = other.version_;
}

Timestamp Cart::updatedAt() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return updatedAt_;
}

int64_t Cart::version() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return version_;
}

std::map<std::string, CartItem> Cart::items() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return items_;
}

std::optional<CartItem> Cart::getItem(const std::string& itemId) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = items_.find(itemId);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<CartItem> Cart::findItemBySku(const std::string& sku) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (const auto& [itemId, item] : items_) {
        if (item.sku == sku) {
            return item;
        }
    }
    return std::nullopt;
}

CartItem Cart::addItem(const CartItem& item) {
    requireCurrency(item);
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto it = items_.find(item.itemId);
    if (it != items_.end() && it->second.sku == item.sku) {
        // Тот же SKU под тем же ключом - складываем количества
        int64_t merged = static_cast<int64_t>(it->second.quantity) + item.quantity;
        if (merged > std::numeric_limits<int>::max()) {
            throw ValidationException("Quantity overflow for item " + item.itemId +
                                      ": " + std::to_string(merged));
        }
        it->second = it->second.withQuantity(static_cast<int>(merged));
    } else if (it != items_.end()) {
        it->second = item;
    } else {
        it = items_.emplace(item.itemId, item).first;
    }

    incrementVersion();
    return it->second;
}

CartItem Cart::updateItemQuantity(const std::string& itemId, int quantity) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto it = items_.find(itemId);
    if (it == items_.end()) {
        throw ItemNotFoundException(itemId, cartId_);
    }

    it->second = it->second.withQuantity(quantity);
    incrementVersion();
    return it->second;
}

std::optional<CartItem> Cart::removeItem(const std::string& itemId) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto it = items_.find(itemId);
    if (it == items_.end()) {
        return std::nullopt;
    }

    CartItem removed = it->second;
    items_.erase(it);
    incrementVersion();
    return removed;
}

void Cart::clear() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    items_.clear();
    incrementVersion();
}

void Cart::mutateAtVersion(
    int64_t expectedVersion,
    const std::function<void(Cart&)>& mutation
) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (version_ != expectedVersion) {
        throw VersionConflictException(cartId_, expectedVersion, version_);
    }

    auto savedItems = items_;
    auto savedUpdatedAt = updatedAt_;
    try {
        mutation(*this);
    } catch (...) {
        items_ = std::move(savedItems);
        updatedAt_ = savedUpdatedAt;
        version_ = expectedVersion;
        throw;
    }
}

Money Cart::totalPrice() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Money total = Money::zero(currency_);
    for (const auto& [itemId, item] : items_) {
        total = total + item.totalPrice();
    }
    return total;
}

int64_t Cart::itemCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    int64_t count = 0;
    for (const auto& [itemId, item] : items_) {
        count += item.quantity;
    }
    return count;
}

bool Cart::isEmpty() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return items_.empty();
}

Cart Cart::snapshot() const {
    return Cart(*this);
}

void Cart::incrementVersion() {
    ++version_;
    updatedAt_ = Timestamp::now();
}

void Cart::requireCurrency(const CartItem& item) const {
    if (item.unitPrice.currency != currency_) {
        throw ValidationException(
            "Currency mismatch: cart uses " + currency_ +
            ", item priced in " + item.unitPrice.currency);
    }
}

} // namespace placement::domain
