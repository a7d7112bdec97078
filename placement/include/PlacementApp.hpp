#pragma once

#include <atomic>
#include <memory>

// Forward declarations - Ports
namespace placement::ports::input {
    class ICartService;
    class IOrderService;
}

namespace placement::ports::output {
    class IEventBus;
}

namespace placement::settings {
    class IPlacementSettings;
}

namespace placement::adapters::primary {
    class OrderPlacementScheduler;
}

/**
 * @class PlacementApp
 * @brief Приложение размещения заказов
 *
 * 1. configureInjection() - настройка Boost.DI
 * 2. subscribeEventLog() - журнал всех доменных событий
 * 3. run() - запуск планировщика и ожидание stop()
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Primary Adapters: OrderPlacementScheduler
 * - Secondary Adapters: InMemory*Repository, InMemoryEventBus
 *
 * Dependency Injection: Boost.DI, singleton scope для stateful адаптеров
 */
class PlacementApp
{
public:
    PlacementApp();
    ~PlacementApp();

    /**
     * @brief Запустить приложение, блокирует до stop()
     */
    void run();

    /**
     * @brief Запросить остановку
     *
     * Только выставляет флаг, поэтому безопасен в обработчике сигнала.
     */
    void stop();

    std::shared_ptr<placement::ports::input::ICartService> cartService() const { return cartService_; }
    std::shared_ptr<placement::ports::input::IOrderService> orderService() const { return orderService_; }

private:
    void configureInjection();
    void subscribeEventLog();
    void printStartupBanner();

    std::shared_ptr<placement::settings::IPlacementSettings> settings_;
    std::shared_ptr<placement::ports::output::IEventBus> eventBus_;
    std::shared_ptr<placement::ports::input::ICartService> cartService_;
    std::shared_ptr<placement::ports::input::IOrderService> orderService_;
    std::shared_ptr<placement::adapters::primary::OrderPlacementScheduler> scheduler_;

    std::atomic<bool> stopRequested_{false};
};
