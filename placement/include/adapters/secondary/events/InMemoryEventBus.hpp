#pragma once

#include "ports/output/IEventBus.hpp"
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace placement::adapters::secondary {

/**
 * @brief In-memory реализация событийной шины
 *
 * Синхронная доставка в вызывающем потоке. Обработчики копируются
 * под блокировкой и вызываются вне её, поэтому обработчик может сам
 * публиковать события или подписываться.
 *
 * Исключение обработчика логируется и не прерывает доставку остальным.
 */
class InMemoryEventBus : public ports::output::IEventBus {
public:
    void publish(const domain::DomainEvent& event) override {
        std::vector<ports::output::EventHandler> targets;
        {
            std::lock_guard<std::mutex> lock(handlersMutex_);
            appendHandlers(event.eventType, targets);
            appendHandlers(ALL_EVENTS, targets);
        }

        for (const auto& handler : targets) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                std::cerr << "[InMemoryEventBus] Handler failed: eventType=" << event.eventType
                          << ", eventId=" << event.eventId
                          << ", error=" << e.what() << std::endl;
            }
        }
    }

    void subscribe(const std::string& eventType, ports::output::EventHandler handler) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers_[eventType].push_back(std::move(handler));
    }

    void unsubscribe(const std::string& eventType) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers_.erase(eventType);
    }

    bool hasSubscribers(const std::string& eventType) const override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(eventType);
        return it != handlers_.end() && !it->second.empty();
    }

    /**
     * @brief Получить количество подписчиков для типа события
     */
    size_t subscriberCount(const std::string& eventType) const {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(eventType);
        return it != handlers_.end() ? it->second.size() : 0;
    }

    /**
     * @brief Очистить все подписки (для тестов)
     */
    void clear() {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers_.clear();
    }

private:
    mutable std::mutex handlersMutex_;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> handlers_;

    // Вызывать под handlersMutex_
    void appendHandlers(const std::string& eventType,
                        std::vector<ports::output::EventHandler>& out) const {
        auto it = handlers_.find(eventType);
        if (it != handlers_.end()) {
            out.insert(out.end(), it->second.begin(), it->second.end());
        }
    }
};

} // namespace placement::adapters::secondary
