#include "domain/Order.hpp"
#include "domain/Cart.hpp"
#include "domain/Exceptions.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>

namespace placement::domain {

Order::Order(
    const std::string& orderId,
    const std::string& userId,
    const std::string& cartId,
    const std::string& idempotencyKey,
    std::vector<OrderItem> items,
    const Money& subtotal,
    const Money& tax,
    OrderStatus status,
    const std::string& shippingAddress,
    const std::string& notes,
    const Timestamp& createdAt,
    const Timestamp& updatedAt
) : orderId_(orderId)
  , userId_(userId)
  , cartId_(cartId)
  , idempotencyKey_(idempotencyKey)
  , items_(std::move(items))
  , subtotal_(subtotal)
  , tax_(tax)
  , total_(subtotal + tax)
  , status_(status)
  , shippingAddress_(shippingAddress)
  , notes_(notes)
  , createdAt_(createdAt)
  , updatedAt_(updatedAt)
{
    if (orderId_.empty()) {
        throw ValidationException("Order ID cannot be empty");
    }
    if (userId_.empty()) {
        throw ValidationException("User ID cannot be empty");
    }
    if (idempotencyKey_.empty()) {
        throw ValidationException("Idempotency key cannot be empty");
    }
    if (items_.empty()) {
        throw ValidationException("Order must have at least one item");
    }
}

Order Order::fromCart(
    const Cart& cart,
    const std::string& idempotencyKey,
    const std::string& shippingAddress,
    const std::string& notes,
    double taxRate
) {
    auto cartItems = cart.items();

    std::vector<CartItem> ordered;
    ordered.reserve(cartItems.size());
    for (const auto& [itemId, item] : cartItems) {
        ordered.push_back(item);
    }
    // Порядок добавления в корзину, itemId - для стабильности
    std::sort(ordered.begin(), ordered.end(),
        [](const CartItem& a, const CartItem& b) {
            if (a.addedAt != b.addedAt) {
                return a.addedAt < b.addedAt;
            }
            return a.itemId < b.itemId;
        });

    std::vector<OrderItem> items;
    items.reserve(ordered.size());
    Money subtotal = Money::zero(cart.currency());
    for (const auto& cartItem : ordered) {
        items.push_back(OrderItem::fromCartItem(cartItem));
        subtotal = subtotal + items.back().totalPrice;
    }

    Money tax = subtotal.multiplyByRate(taxRate);
    auto now = Timestamp::now();

    return Order(
        utils::UuidGenerator::generate(),
        cart.userId(),
        cart.cartId(),
        idempotencyKey,
        std::move(items),
        subtotal,
        tax,
        OrderStatus::PENDING,
        shippingAddress,
        notes,
        now,
        now
    );
}

Order Order::withStatus(OrderStatus newStatus) const {
    Order copy = *this;
    copy.status_ = newStatus;
    copy.updatedAt_ = Timestamp::now();
    return copy;
}

int64_t Order::itemCount() const {
    int64_t count = 0;
    for (const auto& item : items_) {
        count += item.quantity;
    }
    return count;
}

} // namespace placement::domain
