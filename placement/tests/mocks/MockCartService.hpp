#pragma once

#include "ports/input/ICartService.hpp"
#include <gmock/gmock.h>

namespace placement::tests {

/**
 * @brief gmock ICartService
 */
class MockCartService : public ports::input::ICartService {
public:
    MOCK_METHOD(std::shared_ptr<domain::Cart>, createCart,
                (const std::string& userId, const std::string& correlationId), (override));
    MOCK_METHOD(std::shared_ptr<domain::Cart>, getCart, (const std::string& cartId), (override));
    MOCK_METHOD(std::shared_ptr<domain::Cart>, getCartByUserId, (const std::string& userId), (override));
    MOCK_METHOD(std::shared_ptr<domain::Cart>, addItem,
                (const std::string& cartId, const domain::AddItemRequest& request,
                 const std::string& correlationId), (override));
    MOCK_METHOD(std::shared_ptr<domain::Cart>, updateItemQuantity,
                (const std::string& cartId, const std::string& itemId, int quantity,
                 const std::string& correlationId), (override));
    MOCK_METHOD(std::shared_ptr<domain::Cart>, updateItemQuantityWithVersion,
                (const std::string& cartId, const std::string& itemId, int quantity,
                 int64_t expectedVersion, const std::string& correlationId), (override));
    MOCK_METHOD(std::shared_ptr<domain::Cart>, removeItem,
                (const std::string& cartId, const std::string& itemId,
                 const std::string& correlationId), (override));
    MOCK_METHOD(std::shared_ptr<domain::Cart>, clearCart,
                (const std::string& cartId, const std::string& correlationId), (override));
    MOCK_METHOD(void, deleteCart,
                (const std::string& cartId, const std::string& correlationId), (override));
};

} // namespace placement::tests
