#pragma once
#include <gmock/gmock.h>
#include "database.hpp"

class DatabaseMock : public DatabaseInterface {
public:
    MOCK_METHOD(mw::E<void>, init, (), (override));
    MOCK_METHOD(mw::E<int64_t>, createProduct, (const Product&), (override));
    MOCK_METHOD(mw::E<std::optional<Product>>, getProduct, (int64_t), (override));
    MOCK_METHOD(mw::E<int64_t>, countProducts, (), (override));
    MOCK_METHOD(mw::E<int64_t>, createCart, (const std::string&), (override));
    MOCK_METHOD(mw::E<std::optional<Cart>>, getCart, (const std::string&), (override));
    MOCK_METHOD(mw::E<void>, addCartItem, (int64_t, int64_t, int), (override));
    MOCK_METHOD(mw::E<int64_t>, placeOrder, (const Order&, const std::string&), (override));
    MOCK_METHOD(mw::E<std::optional<Order>>, getOrder, (const std::string&), (override));
    MOCK_METHOD(mw::E<int64_t>, countOrders, (), (override));
};
