/**
 * @file InMemoryOrderRepositoryTest.cpp
 * @brief Тесты для InMemoryOrderRepository
 *
 * Проверяет:
 * - Идемпотентное сохранение по ключу (включая гонку)
 * - Индексы по пользователю и статусу
 * - compareAndUpdateStatus
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"
#include "domain/Cart.hpp"
#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace placement::adapters::secondary;
using namespace placement::domain;

// ============================================================================
// TEST FIXTURE
// ============================================================================

class InMemoryOrderRepositoryTest : public ::testing::Test {
protected:
    InMemoryOrderRepository repository_;

    static Order makeOrder(const std::string& userId, const std::string& key) {
        Cart cart(userId, "USD");
        cart.addItem(CartItem("i1", "A", "Product A", 1, Money(10, 0)));
        return Order::fromCart(cart, key, "addr", "");
    }
};

// ============================================================================
// Идемпотентность
// ============================================================================

TEST_F(InMemoryOrderRepositoryTest, SaveIfAbsent_FirstCallStores) {
    auto order = makeOrder("user-1", "k1");

    auto saved = repository_.saveIfAbsentByIdempotencyKey(order);

    EXPECT_EQ(saved.orderId(), order.orderId());
    EXPECT_TRUE(repository_.existsById(order.orderId()));
    EXPECT_TRUE(repository_.existsByIdempotencyKey("k1"));
    EXPECT_EQ(repository_.count(), 1u);
}

TEST_F(InMemoryOrderRepositoryTest, SaveIfAbsent_SecondCandidateIsDiscarded) {
    auto first = makeOrder("user-1", "k1");
    auto second = makeOrder("user-1", "k1");
    repository_.saveIfAbsentByIdempotencyKey(first);

    auto saved = repository_.saveIfAbsentByIdempotencyKey(second);

    EXPECT_EQ(saved.orderId(), first.orderId());
    EXPECT_FALSE(repository_.existsById(second.orderId()));
    EXPECT_EQ(repository_.count(), 1u);
}

TEST_F(InMemoryOrderRepositoryTest, SaveIfAbsent_ReturnsCurrentStatus) {
    auto first = makeOrder("user-1", "k1");
    repository_.saveIfAbsentByIdempotencyKey(first);
    repository_.updateStatus(first.orderId(), OrderStatus::CONFIRMED);

    auto saved = repository_.saveIfAbsentByIdempotencyKey(makeOrder("user-1", "k1"));
    EXPECT_EQ(saved.status(), OrderStatus::CONFIRMED);
    EXPECT_EQ(repository_.findByIdempotencyKey("k1")->status(), OrderStatus::CONFIRMED);
}

TEST_F(InMemoryOrderRepositoryTest, SaveIfAbsent_ConcurrentSameKey_SingleOrder) {
    const int NUM_THREADS = 16;
    std::vector<Order> candidates;
    for (int t = 0; t < NUM_THREADS; ++t) {
        candidates.push_back(makeOrder("user-1", "race-key"));
    }

    std::vector<std::string> results(NUM_THREADS);
    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t]() {
            results[t] = repository_.saveIfAbsentByIdempotencyKey(candidates[t]).orderId();
        });
    }
    for (auto& t : threads) t.join();

    std::set<std::string> distinct(results.begin(), results.end());
    EXPECT_EQ(distinct.size(), 1u);
    EXPECT_EQ(repository_.count(), 1u);
    EXPECT_TRUE(repository_.existsById(*distinct.begin()));
}

TEST_F(InMemoryOrderRepositoryTest, SaveIfAbsent_KeyNeverVisibleBeforeOrder) {
    const int NUM_KEYS = 200;
    std::atomic<bool> writing(true);
    std::atomic<int> keysSeen(0);
    std::atomic<int> missingById(0);
    std::atomic<int> missingByUser(0);

    std::thread reader([&]() {
        while (writing) {
            for (int i = 0; i < NUM_KEYS; ++i) {
                auto placed = repository_.findByIdempotencyKey("key-" + std::to_string(i));
                if (!placed) {
                    continue;
                }
                keysSeen++;
                if (!repository_.findById(placed->orderId())) {
                    missingById++;
                }
                if (repository_.findByUserId(placed->userId()).empty()) {
                    missingByUser++;
                }
            }
        }
    });

    for (int i = 0; i < NUM_KEYS; ++i) {
        repository_.saveIfAbsentByIdempotencyKey(
            makeOrder("user-" + std::to_string(i), "key-" + std::to_string(i)));
    }
    writing = false;
    reader.join();

    EXPECT_EQ(missingById, 0);
    EXPECT_EQ(missingByUser, 0);
    EXPECT_EQ(repository_.count(), static_cast<size_t>(NUM_KEYS));
}

TEST_F(InMemoryOrderRepositoryTest, SaveIfAbsent_LoserCanUpdateStatusImmediately) {
    const int NUM_THREADS = 16;
    std::vector<Order> candidates;
    for (int t = 0; t < NUM_THREADS; ++t) {
        candidates.push_back(makeOrder("user-1", "race-key"));
    }

    std::atomic<int> unreachable(0);
    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t]() {
            auto saved = repository_.saveIfAbsentByIdempotencyKey(candidates[t]);
            if (!repository_.findById(saved.orderId())) {
                unreachable++;
            }
            repository_.compareAndUpdateStatus(
                saved.orderId(), OrderStatus::PENDING, OrderStatus::CONFIRMED);
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(unreachable, 0);
    EXPECT_EQ(repository_.findByIdempotencyKey("race-key")->status(), OrderStatus::CONFIRMED);
}

// ============================================================================
// Поиск
// ============================================================================

TEST_F(InMemoryOrderRepositoryTest, FindByUserId_OnlyOwnOrders) {
    repository_.saveIfAbsentByIdempotencyKey(makeOrder("user-1", "k1"));
    repository_.saveIfAbsentByIdempotencyKey(makeOrder("user-1", "k2"));
    repository_.saveIfAbsentByIdempotencyKey(makeOrder("user-2", "k3"));

    auto orders = repository_.findByUserId("user-1");
    ASSERT_EQ(orders.size(), 2u);
    for (const auto& order : orders) {
        EXPECT_EQ(order.userId(), "user-1");
    }
    EXPECT_GE(orders[0].createdAt(), orders[1].createdAt());
    EXPECT_TRUE(repository_.findByUserId("nobody").empty());
}

TEST_F(InMemoryOrderRepositoryTest, FindByStatus) {
    auto a = repository_.saveIfAbsentByIdempotencyKey(makeOrder("user-1", "k1"));
    repository_.saveIfAbsentByIdempotencyKey(makeOrder("user-1", "k2"));
    repository_.updateStatus(a.orderId(), OrderStatus::CONFIRMED);

    EXPECT_EQ(repository_.findByStatus(OrderStatus::PENDING).size(), 1u);
    auto confirmed = repository_.findByStatus(OrderStatus::CONFIRMED);
    ASSERT_EQ(confirmed.size(), 1u);
    EXPECT_EQ(confirmed[0].orderId(), a.orderId());
}

TEST_F(InMemoryOrderRepositoryTest, FindMissing) {
    EXPECT_FALSE(repository_.findById("missing").has_value());
    EXPECT_FALSE(repository_.findByIdempotencyKey("missing").has_value());
    EXPECT_FALSE(repository_.updateStatus("missing", OrderStatus::CONFIRMED).has_value());
}

TEST_F(InMemoryOrderRepositoryTest, Clear_ReleasesIdempotencyKeys) {
    repository_.saveIfAbsentByIdempotencyKey(makeOrder("user-1", "k1"));

    repository_.clear();

    EXPECT_EQ(repository_.count(), 0u);
    EXPECT_FALSE(repository_.existsByIdempotencyKey("k1"));
    EXPECT_TRUE(repository_.findByUserId("user-1").empty());

    auto again = makeOrder("user-1", "k1");
    EXPECT_EQ(repository_.saveIfAbsentByIdempotencyKey(again).orderId(), again.orderId());
}

// ============================================================================
// Смена статуса
// ============================================================================

TEST_F(InMemoryOrderRepositoryTest, CompareAndUpdate_AppliesOnlyOnExpectedStatus) {
    auto order = repository_.saveIfAbsentByIdempotencyKey(makeOrder("user-1", "k1"));

    auto stale = repository_.compareAndUpdateStatus(
        order.orderId(), OrderStatus::CONFIRMED, OrderStatus::PROCESSING);
    EXPECT_FALSE(stale.has_value());
    EXPECT_EQ(repository_.findById(order.orderId())->status(), OrderStatus::PENDING);

    auto applied = repository_.compareAndUpdateStatus(
        order.orderId(), OrderStatus::PENDING, OrderStatus::CONFIRMED);
    ASSERT_TRUE(applied.has_value());
    EXPECT_EQ(applied->status(), OrderStatus::CONFIRMED);
}

TEST_F(InMemoryOrderRepositoryTest, CompareAndUpdate_ConcurrentOnlyOneApplies) {
    auto order = repository_.saveIfAbsentByIdempotencyKey(makeOrder("user-1", "k1"));
    const int NUM_THREADS = 8;
    std::atomic<int> applied(0);

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&]() {
            if (repository_.compareAndUpdateStatus(
                    order.orderId(), OrderStatus::PENDING, OrderStatus::CANCELLED)) {
                applied++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(applied, 1);
}
