#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <mw/database.hpp>
#include <mw/error.hpp>

#include "types.hpp"

class DatabaseInterface
{
public:
    virtual ~DatabaseInterface() = default;
    virtual mw::E<void> init() = 0;

    // Product DAO
    virtual mw::E<int64_t> createProduct(const Product& product) = 0;
    virtual mw::E<std::optional<Product>> getProduct(int64_t id) = 0;
    virtual mw::E<int64_t> countProducts() = 0;

    // Cart DAO
    virtual mw::E<int64_t> createCart(const std::string& session_id) = 0;
    virtual mw::E<std::optional<Cart>> getCart(const std::string& session_id) = 0;
    // Adds to the quantity if the product is already in the cart.
    virtual mw::E<void> addCartItem(int64_t cart_id, int64_t product_id,
                                    int quantity) = 0;

    // Order DAO
    // Store the order with its items and empty the cart, all or
    // nothing. Returns the order ID.
    virtual mw::E<int64_t> placeOrder(const Order& order,
                                      const std::string& cart_session) = 0;
    virtual mw::E<std::optional<Order>>
    getOrder(const std::string& order_number) = 0;
    virtual mw::E<int64_t> countOrders() = 0;
};

class Database : public DatabaseInterface
{
public:
    explicit Database(const std::string& path);
    mw::E<void> init() override;

    // Product DAO
    mw::E<int64_t> createProduct(const Product& product) override;
    mw::E<std::optional<Product>> getProduct(int64_t id) override;
    mw::E<int64_t> countProducts() override;

    // Cart DAO
    mw::E<int64_t> createCart(const std::string& session_id) override;
    mw::E<std::optional<Cart>> getCart(const std::string& session_id) override;
    mw::E<void> addCartItem(int64_t cart_id, int64_t product_id,
                            int quantity) override;

    // Order DAO
    mw::E<int64_t> placeOrder(const Order& order,
                              const std::string& cart_session) override;
    mw::E<std::optional<Order>>
    getOrder(const std::string& order_number) override;
    mw::E<int64_t> countOrders() override;

private:
    std::string db_path;
    std::unique_ptr<mw::SQLite> db;
    // One connection shared by all request threads.
    std::mutex lock;

    mw::E<void> migrate();
    mw::E<int64_t> insertOrder(const Order& order,
                               const std::string& cart_session);
};
