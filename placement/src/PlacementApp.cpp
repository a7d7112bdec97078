#include "PlacementApp.hpp"

// Application Services
#include "application/CartService.hpp"
#include "application/OrderService.hpp"

// Primary Adapters
#include "adapters/primary/OrderPlacementScheduler.hpp"

// Secondary Adapters
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "adapters/secondary/persistence/InMemoryCartRepository.hpp"
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"

// Settings
#include "settings/PlacementSettings.hpp"

#include <boost/di.hpp>
#include <chrono>
#include <iostream>
#include <thread>

namespace di = boost::di;

// ============================================================================
// Конфигурационные константы
// ============================================================================
namespace config
{
    constexpr auto STOP_POLL_INTERVAL = std::chrono::milliseconds(100);
}

// ============================================================================
// PlacementApp Implementation
// ============================================================================

PlacementApp::PlacementApp()
{
    std::cout << "[PlacementApp] Application created" << std::endl;
}

PlacementApp::~PlacementApp()
{
    if (scheduler_)
    {
        scheduler_->stop();
    }
    std::cout << "[PlacementApp] Application destroyed" << std::endl;
}

void PlacementApp::configureInjection()
{
    std::cout << "[PlacementApp] Configuring Boost.DI injection..." << std::endl;

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Settings & Secondary Adapters (Output Ports)
        // ====================================================================

        // IPlacementSettings ← PlacementSettings (ENV)
        di::bind<placement::settings::IPlacementSettings>()
            .to<placement::settings::PlacementSettings>()
            .in(di::singleton),

        // IEventBus ← InMemoryEventBus
        di::bind<placement::ports::output::IEventBus>()
            .to<placement::adapters::secondary::InMemoryEventBus>()
            .in(di::singleton),

        // Repositories - in-memory хранилища
        di::bind<placement::ports::output::ICartRepository>()
            .to<placement::adapters::secondary::InMemoryCartRepository>()
            .in(di::singleton),

        di::bind<placement::ports::output::IOrderRepository>()
            .to<placement::adapters::secondary::InMemoryOrderRepository>()
            .in(di::singleton),

        // ====================================================================
        // Layer 2: Application Services (Input Ports)
        // ====================================================================

        // ICartService ← CartService(ICartRepository, IEventBus, IPlacementSettings)
        di::bind<placement::ports::input::ICartService>()
            .to<placement::application::CartService>()
            .in(di::singleton),

        // IOrderService ← OrderService(IOrderRepository, ICartRepository, ICartService, IEventBus, IPlacementSettings)
        di::bind<placement::ports::input::IOrderService>()
            .to<placement::application::OrderService>()
            .in(di::singleton)
    );

    settings_ = injector.create<std::shared_ptr<placement::settings::IPlacementSettings>>();
    eventBus_ = injector.create<std::shared_ptr<placement::ports::output::IEventBus>>();
    cartService_ = injector.create<std::shared_ptr<placement::ports::input::ICartService>>();
    orderService_ = injector.create<std::shared_ptr<placement::ports::input::IOrderService>>();

    // ========================================================================
    // Layer 3: Primary Adapters
    // ========================================================================
    scheduler_ = injector.create<std::shared_ptr<placement::adapters::primary::OrderPlacementScheduler>>();

    std::cout << "[PlacementApp] Boost.DI injection configured" << std::endl;
}

void PlacementApp::subscribeEventLog()
{
    eventBus_->subscribe(placement::ports::output::IEventBus::ALL_EVENTS,
        [](const placement::domain::DomainEvent& event) {
            std::cout << "[EventLog] " << event.toJson() << std::endl;
        });
}

void PlacementApp::run()
{
    configureInjection();
    subscribeEventLog();
    printStartupBanner();

    if (settings_->isSchedulerEnabled())
    {
        scheduler_->start();
    }
    else
    {
        std::cout << "[PlacementApp] Scheduler disabled (SCHEDULER_ENABLED=false)" << std::endl;
    }

    while (!stopRequested_)
    {
        std::this_thread::sleep_for(config::STOP_POLL_INTERVAL);
    }

    std::cout << "[PlacementApp] Stopping..." << std::endl;
    scheduler_->stop();
}

void PlacementApp::stop()
{
    stopRequested_ = true;
}

void PlacementApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║                 Order Placement Core                         ║" << std::endl;
    std::cout << "╠══════════════════════════════════════════════════════════════╣" << std::endl;
    std::cout << "║  Cart:      optimistic versioning                            ║" << std::endl;
    std::cout << "║  Orders:    idempotent placement by key                      ║" << std::endl;
    std::cout << "║  Lifecycle: PENDING → CONFIRMED → PROCESSING → SHIPPED       ║" << std::endl;
    std::cout << "║             → DELIVERED, cancel from PENDING | CONFIRMED      ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════════╝" << std::endl;
    std::cout << "  Tax rate:  " << settings_->getTaxRate() << std::endl;
    std::cout << "  Currency:  " << settings_->getCurrency() << std::endl;
    std::cout << "  Scheduler: " << (settings_->isSchedulerEnabled() ? "enabled" : "disabled")
              << ", interval=" << settings_->getSchedulerInterval().count() << "ms" << std::endl;
    std::cout << std::endl;
}
