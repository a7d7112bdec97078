#pragma once

#include "settings/IPlacementSettings.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace placement::settings {

/**
 * @brief Настройки размещения заказов из окружения
 *
 * Читает из ENV:
 * - TAX_RATE (default: 0.10), допустимо [0, 1]
 * - CURRENCY (default: USD)
 * - SCHEDULER_ENABLED (default: true)
 * - SCHEDULER_INTERVAL_MS (default: 2000), > 0
 *
 * Некорректное значение заменяется значением по умолчанию с предупреждением.
 */
class PlacementSettings : public IPlacementSettings {
public:
    PlacementSettings() {
        if (const char* val = std::getenv("TAX_RATE")) {
            try {
                double rate = std::stod(val);
                if (rate >= 0.0 && rate <= 1.0) {
                    taxRate_ = rate;
                } else {
                    warnInvalid("TAX_RATE", val);
                }
            } catch (const std::exception&) {
                warnInvalid("TAX_RATE", val);
            }
        }
        if (const char* val = std::getenv("CURRENCY")) {
            if (*val != '\0') {
                currency_ = val;
            }
        }
        if (const char* val = std::getenv("SCHEDULER_ENABLED")) {
            std::string flag(val);
            if (flag == "true" || flag == "1") {
                schedulerEnabled_ = true;
            } else if (flag == "false" || flag == "0") {
                schedulerEnabled_ = false;
            } else {
                warnInvalid("SCHEDULER_ENABLED", val);
            }
        }
        if (const char* val = std::getenv("SCHEDULER_INTERVAL_MS")) {
            try {
                long ms = std::stol(val);
                if (ms > 0) {
                    schedulerIntervalMs_ = ms;
                } else {
                    warnInvalid("SCHEDULER_INTERVAL_MS", val);
                }
            } catch (const std::exception&) {
                warnInvalid("SCHEDULER_INTERVAL_MS", val);
            }
        }
    }

    double getTaxRate() const override { return taxRate_; }
    std::string getCurrency() const override { return currency_; }
    bool isSchedulerEnabled() const override { return schedulerEnabled_; }

    std::chrono::milliseconds getSchedulerInterval() const override {
        return std::chrono::milliseconds(schedulerIntervalMs_);
    }

private:
    double taxRate_ = 0.10;
    std::string currency_ = "USD";
    bool schedulerEnabled_ = true;
    long schedulerIntervalMs_ = 2000;

    static void warnInvalid(const char* name, const char* value) {
        std::cerr << "[PlacementSettings] Invalid " << name << "=" << value
                  << ", using default" << std::endl;
    }
};

} // namespace placement::settings
