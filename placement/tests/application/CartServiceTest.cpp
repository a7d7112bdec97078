/**
 * @file CartServiceTest.cpp
 * @brief Unit tests for CartService
 */

#include <gtest/gtest.h>
#include "application/CartService.hpp"
#include "adapters/secondary/persistence/InMemoryCartRepository.hpp"
#include "../mocks/MockEventBus.hpp"
#include "../mocks/MockPlacementSettings.hpp"
#include <stdexcept>

using namespace placement;
using namespace placement::application;
using namespace placement::tests;
using ::testing::_;
using ::testing::Throw;

class CartServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<adapters::secondary::InMemoryCartRepository>();
        eventBus_ = std::make_shared<RecordingEventBus>();
        settings_ = std::make_shared<MockPlacementSettings>();

        cartService_ = std::make_shared<CartService>(repository_, eventBus_, settings_);
    }

    static domain::AddItemRequest itemRequest(const std::string& sku, int quantity, double price) {
        domain::AddItemRequest request;
        request.sku = sku;
        request.productName = "Product " + sku;
        request.quantity = quantity;
        request.unitPrice = domain::Money::fromDouble(price);
        return request;
    }

    std::shared_ptr<adapters::secondary::InMemoryCartRepository> repository_;
    std::shared_ptr<RecordingEventBus> eventBus_;
    std::shared_ptr<MockPlacementSettings> settings_;
    std::shared_ptr<CartService> cartService_;
};

// ============================================================================
// CREATE / GET
// ============================================================================

TEST_F(CartServiceTest, CreateCart_StoresAndPublishes) {
    auto cart = cartService_->createCart("user-1", "corr-1");

    EXPECT_EQ(cartService_->getCart(cart->cartId()), cart);
    EXPECT_EQ(cartService_->getCartByUserId("user-1"), cart);
    EXPECT_EQ(cart->currency(), "USD");

    auto event = eventBus_->last<domain::CartEvent>(domain::CartEvent::CREATED);
    ASSERT_NE(event, nullptr);
    EXPECT_EQ(event->aggregateId, cart->cartId());
    EXPECT_EQ(event->correlationId, "corr-1");
    EXPECT_EQ(event->userId, "user-1");
}

TEST_F(CartServiceTest, CreateCart_UsesConfiguredCurrency) {
    settings_->currency = "EUR";

    auto cart = cartService_->createCart("user-1", "corr-1");

    EXPECT_EQ(cart->currency(), "EUR");
    EXPECT_EQ(cart->totalPrice(), domain::Money::zero("EUR"));
}

TEST_F(CartServiceTest, GetCart_Missing_ReturnsNull) {
    EXPECT_EQ(cartService_->getCart("missing"), nullptr);
}

// ============================================================================
// ITEMS
// ============================================================================

TEST_F(CartServiceTest, AddItem_SameSkuMergesIntoOneItem) {
    auto cart = cartService_->createCart("user-1", "corr-1");

    cartService_->addItem(cart->cartId(), itemRequest("A", 2, 10.0), "corr-2");
    cartService_->addItem(cart->cartId(), itemRequest("A", 1, 10.0), "corr-3");

    auto items = cart->items();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items.begin()->second.quantity, 3);
    EXPECT_EQ(cart->totalPrice(), domain::Money(30, 0));
    EXPECT_EQ(eventBus_->countOf(domain::CartEvent::ITEM_ADDED), 2);

    auto event = eventBus_->last<domain::CartEvent>(domain::CartEvent::ITEM_ADDED);
    EXPECT_EQ(event->quantity, 3);
    EXPECT_EQ(event->version, 2);
}

TEST_F(CartServiceTest, AddItem_DifferentSkusAreSeparateItems) {
    auto cart = cartService_->createCart("user-1", "corr-1");

    cartService_->addItem(cart->cartId(), itemRequest("A", 1, 10.0), "corr-2");
    cartService_->addItem(cart->cartId(), itemRequest("B", 1, 5.0), "corr-3");

    EXPECT_EQ(cart->items().size(), 2u);
    EXPECT_EQ(cart->totalPrice(), domain::Money(15, 0));
}

TEST_F(CartServiceTest, AddItem_MissingCart_Throws) {
    EXPECT_THROW(cartService_->addItem("missing", itemRequest("A", 1, 1.0), "corr"),
                 domain::CartNotFoundException);
}

TEST_F(CartServiceTest, AddItem_InvalidQuantity_Throws) {
    auto cart = cartService_->createCart("user-1", "corr-1");

    EXPECT_THROW(cartService_->addItem(cart->cartId(), itemRequest("A", 0, 1.0), "corr"),
                 domain::ValidationException);
    EXPECT_TRUE(cart->isEmpty());
}

TEST_F(CartServiceTest, AddItem_CurrencyMismatch_Throws) {
    auto cart = cartService_->createCart("user-1", "corr-1");
    auto request = itemRequest("A", 1, 1.0);
    request.unitPrice.currency = "EUR";

    EXPECT_THROW(cartService_->addItem(cart->cartId(), request, "corr"),
                 domain::ValidationException);
}

TEST_F(CartServiceTest, UpdateAndRemoveItem) {
    auto cart = cartService_->createCart("user-1", "corr-1");
    cartService_->addItem(cart->cartId(), itemRequest("A", 1, 10.0), "corr-2");
    auto itemId = cart->findItemBySku("A")->itemId;

    cartService_->updateItemQuantity(cart->cartId(), itemId, 5, "corr-3");
    EXPECT_EQ(cart->getItem(itemId)->quantity, 5);

    cartService_->removeItem(cart->cartId(), itemId, "corr-4");
    EXPECT_TRUE(cart->isEmpty());

    EXPECT_EQ(eventBus_->countOf(domain::CartEvent::ITEM_UPDATED), 1);
    EXPECT_EQ(eventBus_->countOf(domain::CartEvent::ITEM_REMOVED), 1);
}

TEST_F(CartServiceTest, RemoveItem_Missing_Throws) {
    auto cart = cartService_->createCart("user-1", "corr-1");

    EXPECT_THROW(cartService_->removeItem(cart->cartId(), "missing", "corr"),
                 domain::ItemNotFoundException);
    EXPECT_EQ(cart->version(), 0);
}

// ============================================================================
// VERSION CHECK
// ============================================================================

TEST_F(CartServiceTest, UpdateWithVersion_CurrentVersionSucceeds) {
    auto cart = cartService_->createCart("user-1", "corr-1");
    cartService_->addItem(cart->cartId(), itemRequest("A", 1, 10.0), "corr-2");
    auto itemId = cart->findItemBySku("A")->itemId;

    auto updated = cartService_->updateItemQuantityWithVersion(
        cart->cartId(), itemId, 4, cart->version(), "corr-3");

    EXPECT_EQ(updated->getItem(itemId)->quantity, 4);
    EXPECT_EQ(updated->version(), 2);
    EXPECT_EQ(cartService_->getCart(cart->cartId()), updated);
}

TEST_F(CartServiceTest, UpdateWithVersion_StaleVersionConflicts) {
    auto cart = cartService_->createCart("user-1", "corr-1");
    cartService_->addItem(cart->cartId(), itemRequest("A", 1, 10.0), "corr-2");
    auto itemId = cart->findItemBySku("A")->itemId;
    auto staleVersion = cart->version();

    cartService_->addItem(cart->cartId(), itemRequest("B", 1, 5.0), "corr-3");

    EXPECT_THROW(cartService_->updateItemQuantityWithVersion(
                     cart->cartId(), itemId, 4, staleVersion, "corr-4"),
                 domain::VersionConflictException);
    EXPECT_EQ(cart->getItem(itemId)->quantity, 1);
}

TEST_F(CartServiceTest, UpdateWithVersion_LaterAddsReachStoredCart) {
    auto cart = cartService_->createCart("user-1", "corr-1");
    cartService_->addItem(cart->cartId(), itemRequest("A", 1, 10.0), "corr-2");
    auto itemId = cart->findItemBySku("A")->itemId;

    cartService_->updateItemQuantityWithVersion(cart->cartId(), itemId, 3, cart->version(), "corr-3");
    cartService_->addItem(cart->cartId(), itemRequest("B", 1, 5.0), "corr-4");
    cart->addItem(domain::CartItem("direct", "C", "Product C", 1, domain::Money(1, 0)));

    auto stored = cartService_->getCart(cart->cartId());
    EXPECT_EQ(stored, cart);
    EXPECT_EQ(stored->items().size(), 3u);
    EXPECT_EQ(stored->getItem(itemId)->quantity, 3);
    EXPECT_EQ(stored->version(), 4);
}

TEST_F(CartServiceTest, UpdateWithVersion_MissingCart_Throws) {
    EXPECT_THROW(cartService_->updateItemQuantityWithVersion("missing", "i", 1, 0, "corr"),
                 domain::CartNotFoundException);
}

// ============================================================================
// CLEAR / DELETE
// ============================================================================

TEST_F(CartServiceTest, ClearCart_EmptiesAndBumpsVersion) {
    auto cart = cartService_->createCart("user-1", "corr-1");
    cartService_->addItem(cart->cartId(), itemRequest("A", 1, 10.0), "corr-2");

    cartService_->clearCart(cart->cartId(), "corr-3");

    EXPECT_TRUE(cart->isEmpty());
    EXPECT_EQ(cart->version(), 2);
    EXPECT_EQ(eventBus_->countOf(domain::CartEvent::CLEARED), 1);
}

TEST_F(CartServiceTest, DeleteCart) {
    auto cart = cartService_->createCart("user-1", "corr-1");

    cartService_->deleteCart(cart->cartId(), "corr-2");

    EXPECT_EQ(cartService_->getCart(cart->cartId()), nullptr);
    EXPECT_EQ(cartService_->getCartByUserId("user-1"), nullptr);
    EXPECT_EQ(eventBus_->countOf(domain::CartEvent::DELETED), 1);
    EXPECT_THROW(cartService_->deleteCart(cart->cartId(), "corr-3"), domain::CartNotFoundException);
}

// ============================================================================
// EVENT BUS FAILURE
// ============================================================================

TEST_F(CartServiceTest, PublishFailure_DoesNotAffectState) {
    auto failingBus = std::make_shared<MockEventBus>();
    EXPECT_CALL(*failingBus, publish(_))
        .WillRepeatedly(Throw(std::runtime_error("bus down")));
    CartService service(repository_, failingBus, settings_);

    std::shared_ptr<domain::Cart> cart;
    ASSERT_NO_THROW(cart = service.createCart("user-1", "corr-1"));
    ASSERT_NO_THROW(service.addItem(cart->cartId(), itemRequest("A", 2, 10.0), "corr-2"));

    EXPECT_EQ(cart->itemCount(), 2);
    EXPECT_EQ(repository_->count(), 1u);
}
