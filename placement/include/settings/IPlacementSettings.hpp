#pragma once

#include <chrono>
#include <string>

namespace placement::settings {

/**
 * @brief Настройки размещения заказов
 */
class IPlacementSettings {
public:
    virtual ~IPlacementSettings() = default;

    /// Налоговая ставка для новых заказов (0.10 = 10%)
    virtual double getTaxRate() const = 0;

    /// Валюта новых корзин
    virtual std::string getCurrency() const = 0;

    virtual bool isSchedulerEnabled() const = 0;

    virtual std::chrono::milliseconds getSchedulerInterval() const = 0;
};

} // namespace placement::settings
