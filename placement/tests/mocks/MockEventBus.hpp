#pragma once

#include "ports/output/IEventBus.hpp"
#include <gmock/gmock.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace placement::tests {

/**
 * @brief Записывающая реализация IEventBus для тестов
 *
 * Сохраняет копии всех опубликованных событий. Потокобезопасна.
 */
class RecordingEventBus : public ports::output::IEventBus {
public:
    void publish(const domain::DomainEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event.clone());
    }

    void subscribe(const std::string&, ports::output::EventHandler) override {}
    void unsubscribe(const std::string&) override {}
    bool hasSubscribers(const std::string&) const override { return false; }

    // Получение опубликованных событий
    std::vector<std::string> eventTypes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> types;
        for (const auto& e : events_) types.push_back(e->eventType);
        return types;
    }

    int countOf(const std::string& eventType) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int count = 0;
        for (const auto& e : events_) {
            if (e->eventType == eventType) ++count;
        }
        return count;
    }

    /// Последнее событие указанного типа (nullptr если не было)
    template <typename T>
    std::unique_ptr<T> last(const std::string& eventType) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
            if ((*it)->eventType == eventType) {
                return std::unique_ptr<T>(static_cast<T*>((*it)->clone().release()));
            }
        }
        return nullptr;
    }

    size_t publishCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    void clearEvents() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<domain::DomainEvent>> events_;
};

/**
 * @brief gmock IEventBus - для проверки вызовов и внедрения сбоев
 */
class MockEventBus : public ports::output::IEventBus {
public:
    MOCK_METHOD(void, publish, (const domain::DomainEvent& event), (override));
    MOCK_METHOD(void, subscribe, (const std::string& eventType, ports::output::EventHandler handler), (override));
    MOCK_METHOD(void, unsubscribe, (const std::string& eventType), (override));
    MOCK_METHOD(bool, hasSubscribers, (const std::string& eventType), (const, override));
};

} // namespace placement::tests
