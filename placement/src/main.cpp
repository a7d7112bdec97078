#include "PlacementApp.hpp"
#include <iostream>
#include <csignal>

// Глобальный указатель для обработки сигналов
PlacementApp* g_app = nullptr;

void signalHandler(int signal)
{
    (void)signal;
    if (g_app)
    {
        g_app->stop();
    }
}

int main()
{
    try
    {
        PlacementApp app;
        g_app = &app;

        // Устанавливаем обработчики сигналов для graceful shutdown
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Order Placement Starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << std::endl;

        app.run();

        g_app = nullptr;

        std::cout << "\n========================================" << std::endl;
        std::cout << "  Order Placement Stopped" << std::endl;
        std::cout << "========================================" << std::endl;

        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
