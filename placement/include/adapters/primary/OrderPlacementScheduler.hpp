#pragma once

#include "ports/input/ICartService.hpp"
#include "ports/input/IOrderService.hpp"
#include "settings/IPlacementSettings.hpp"
#include "utils/UuidGenerator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <iterator>
#include <mutex>
#include <optional>
#include <random>
#include <thread>

namespace placement::adapters::primary {

/**
 * @brief Фоновый генератор заказов
 *
 * Каждые SCHEDULER_INTERVAL_MS:
 * 1. Создаёт корзину для синтетического пользователя scheduled-user-N
 * 2. Кладёт 1-3 случайных товара из каталога (количество 1-3)
 * 3. Размещает заказ с уникальным ключом идемпотентности
 *
 * Ошибка итерации логируется и не останавливает поток.
 */
class OrderPlacementScheduler {
public:
    struct SampleProduct {
        const char* sku;
        const char* name;
        double price;
    };

    static constexpr SampleProduct SAMPLE_PRODUCTS[] = {
        {"LAPTOP-001",     "MacBook Pro 16",    2499.00},
        {"PHONE-001",      "iPhone 15 Pro",     1199.00},
        {"TABLET-001",     "iPad Pro 12.9",     1099.00},
        {"WATCH-001",      "Apple Watch Ultra",  799.00},
        {"HEADPHONES-001", "AirPods Pro",        249.00},
        {"KEYBOARD-001",   "Magic Keyboard",     299.00},
        {"MOUSE-001",      "Magic Mouse",         99.00},
        {"MONITOR-001",    "Studio Display",    1599.00},
        {"CASE-001",       "Laptop Case",         79.00},
        {"CHARGER-001",    "MagSafe Charger",     39.00},
    };

    static constexpr const char* SAMPLE_ADDRESSES[] = {
        "123 Tech Park, Suite 100, San Francisco, CA 94105",
        "456 Innovation Drive, Austin, TX 78701",
        "789 Startup Lane, Seattle, WA 98101",
        "321 Digital Avenue, New York, NY 10001",
        "654 Cloud Street, Boston, MA 02101",
    };

    OrderPlacementScheduler(
        std::shared_ptr<ports::input::ICartService> cartService,
        std::shared_ptr<ports::input::IOrderService> orderService,
        std::shared_ptr<settings::IPlacementSettings> settings)
        : cartService_(std::move(cartService))
        , orderService_(std::move(orderService))
        , settings_(std::move(settings))
        , running_(false)
        , attemptCount_(0)
        , placedCount_(0)
        , rng_(std::random_device{}())
    {}

    ~OrderPlacementScheduler() {
        stop();
    }

    // Non-copyable, non-movable
    OrderPlacementScheduler(const OrderPlacementScheduler&) = delete;
    OrderPlacementScheduler& operator=(const OrderPlacementScheduler&) = delete;

    /**
     * @brief Запустить фоновый поток (повторный вызов игнорируется)
     */
    void start() {
        if (running_.exchange(true)) return;

        auto interval = settings_->getSchedulerInterval();
        std::cout << "[OrderPlacementScheduler] Started, interval="
                  << interval.count() << "ms" << std::endl;

        thread_ = std::thread([this, interval]() {
            while (running_) {
                runOnce();

                std::unique_lock<std::mutex> lock(wakeMutex_);
                wakeCv_.wait_for(lock, interval, [this] { return !running_; });
            }
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(wakeMutex_);
            if (!running_.exchange(false)) return;
        }
        wakeCv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        std::cout << "[OrderPlacementScheduler] Stopped, attempts=" << attemptCount_
                  << ", ordersPlaced=" << placedCount_ << std::endl;
    }

    bool isRunning() const { return running_; }

    /// Количество начатых итераций (включая неудачные)
    uint64_t attemptCount() const { return attemptCount_; }

    uint64_t placedCount() const { return placedCount_; }

    /**
     * @brief Одна итерация: корзина -> товары -> заказ
     *
     * Не вызывать параллельно с собой (генератор случайных чисел общий).
     *
     * @return Размещённый заказ или nullopt при ошибке
     */
    std::optional<domain::Order> runOnce() {
        std::string correlationId = "scheduled-" + utils::UuidGenerator::shortId();
        uint64_t orderNum = ++attemptCount_;

        try {
            std::cout << "[OrderPlacementScheduler] Starting scheduled order #" << orderNum
                      << ", correlationId=" << correlationId << std::endl;

            auto cart = cartService_->createCart(
                "scheduled-user-" + std::to_string(orderNum), correlationId);

            int itemCount = randomInt(1, 3);
            for (int i = 0; i < itemCount; ++i) {
                const auto& product = SAMPLE_PRODUCTS[randomIndex(std::size(SAMPLE_PRODUCTS))];

                domain::AddItemRequest item;
                item.sku = product.sku;
                item.productName = product.name;
                item.quantity = randomInt(1, 3);
                item.unitPrice = domain::Money::fromDouble(product.price, cart->currency());

                cartService_->addItem(cart->cartId(), item, correlationId);
            }

            auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();

            domain::PlaceOrderRequest request;
            request.cartId = cart->cartId();
            request.idempotencyKey = "scheduled-order-" + std::to_string(orderNum) +
                                     "-" + std::to_string(millis);
            request.shippingAddress = SAMPLE_ADDRESSES[randomIndex(std::size(SAMPLE_ADDRESSES))];
            request.notes = "Scheduled order #" + std::to_string(orderNum);

            auto result = orderService_->placeOrder(request, correlationId);
            ++placedCount_;

            std::cout << "[OrderPlacementScheduler] Scheduled order #" << orderNum
                      << " placed: orderId=" << result.order.orderId()
                      << ", items=" << result.order.itemCount()
                      << ", total=" << result.order.total().toString() << std::endl;
            return result.order;

        } catch (const std::exception& e) {
            std::cerr << "[OrderPlacementScheduler] Failed to place scheduled order #" << orderNum
                      << ": " << e.what()
                      << ", correlationId=" << correlationId << std::endl;
            return std::nullopt;
        }
    }

private:
    std::shared_ptr<ports::input::ICartService> cartService_;
    std::shared_ptr<ports::input::IOrderService> orderService_;
    std::shared_ptr<settings::IPlacementSettings> settings_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> attemptCount_;
    std::atomic<uint64_t> placedCount_;
    std::thread thread_;
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;
    std::mt19937 rng_;

    int randomInt(int from, int to) {
        return std::uniform_int_distribution<int>(from, to)(rng_);
    }

    size_t randomIndex(size_t size) {
        return std::uniform_int_distribution<size_t>(0, size - 1)(rng_);
    }
};

} // namespace placement::adapters::primary
