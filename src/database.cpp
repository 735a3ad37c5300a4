#include "database.hpp"

#include <tuple>

#include <mw/error.hpp>
#include <mw/utils.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

// Receipts are stored in the shape the facilitator sends them.
std::string receiptToStored(const std::optional<SettlementReceipt>& receipt)
{
    if(!receipt.has_value())
    {
        return "";
    }
    nlohmann::json j = {
        {"transaction_receipt",
         {{"receipt_id", receipt->receipt_id},
          {"transaction_id", receipt->transaction_id},
          {"payment_rail_used", receipt->payment_rail_used},
          {"amount", centsToDouble(receipt->amount)},
          {"processing_fee", centsToDouble(receipt->processing_fee)},
          {"net_amount", centsToDouble(receipt->net_amount)}}},
        {"remaining_delegation_limit",
         centsToDouble(receipt->remaining_delegation_limit)}};
    return j.dump();
}

mw::E<nlohmann::json> parseStored(const std::string& text)
{
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if(j.is_discarded())
    {
        return std::unexpected(
            mw::runtimeError("Corrupted JSON column in orders table"));
    }
    return j;
}

// Delegated orders carry no address, so stored addresses may be empty.
mw::E<Address> addressFromStored(const std::string& text)
{
    ASSIGN_OR_RETURN(nlohmann::json j, parseStored(text));
    if(!j.is_object())
    {
        return std::unexpected(mw::runtimeError("Stored address is not an object"));
    }
    Address a;
    a.street = j.value("street", "");
    a.city = j.value("city", "");
    a.state = j.value("state", "");
    a.postal_code = j.value("postal_code", "");
    a.country = j.value("country", "");
    return a;
}

using OrderTuple =
    std::tuple<int64_t, std::string, std::string, std::string, std::string,
               std::string, std::string, int64_t, int64_t, int64_t, int64_t,
               int64_t, std::string, std::string, std::string, std::string,
               std::string, std::string, std::string, std::string, int64_t>;

mw::E<Order> rowToOrder(const OrderTuple& row)
{
    Order o;
    o.id = std::get<0>(row);
    o.order_number = std::get<1>(row);
    o.customer.name = std::get<2>(row);
    o.customer.email = std::get<3>(row);
    o.customer.phone = std::get<4>(row);
    ASSIGN_OR_RETURN(o.shipping_address, addressFromStored(std::get<5>(row)));
    ASSIGN_OR_RETURN(o.billing_address, addressFromStored(std::get<6>(row)));
    o.amount.subtotal = std::get<7>(row);
    o.amount.shipping = std::get<8>(row);
    o.amount.tax = std::get<9>(row);
    o.amount.discount = std::get<10>(row);
    o.amount.total = std::get<11>(row);
    o.amount.currency = std::get<12>(row);
    o.status = std::get<13>(row);
    o.payment_method = std::get<14>(row);
    o.payment_status = std::get<15>(row);
    o.card_brand = std::get<16>(row);
    o.card_last_four = std::get<17>(row);
    o.transaction_id = std::get<18>(row);
    if(!std::get<19>(row).empty())
    {
        ASSIGN_OR_RETURN(nlohmann::json receipt, parseStored(std::get<19>(row)));
        ASSIGN_OR_RETURN(o.receipt,
                         SettlementReceipt::fromSettleResponse(receipt));
    }
    o.created_at = mw::secondsToTime(std::get<20>(row));
    return o;
}

} // namespace

Database::Database(const std::string& path) : db_path(path) {}

mw::E<void> Database::init()
{
    std::lock_guard<std::mutex> guard(lock);
    auto conn = mw::SQLite::connectFile(db_path);
    if(!conn)
    {
        return std::unexpected(conn.error());
    }
    db = std::move(*conn);

    if(db_path != ":memory:")
    {
        DO_OR_RETURN(db->execute("PRAGMA journal_mode=WAL;"));
    }
    DO_OR_RETURN(db->execute("PRAGMA foreign_keys=ON;"));

    return migrate();
}

mw::E<void> Database::migrate()
{
    auto version_res = db->evalToValue<int>("PRAGMA user_version;");
    if(!version_res)
    {
        return std::unexpected(version_res.error());
    }

    int version = *version_res;

    if(version == 0)
    {
        spdlog::info("Creating database schema v1...");

        const std::vector<std::string> statements = {
            R"(CREATE TABLE IF NOT EXISTS products (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT NOT NULL,
                description TEXT NOT NULL DEFAULT '',
                price INTEGER NOT NULL
            );)",

            R"(CREATE TABLE IF NOT EXISTS carts (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                session_id TEXT UNIQUE NOT NULL,
                created_at INTEGER NOT NULL
            );)",

            R"(CREATE TABLE IF NOT EXISTS cart_items (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                cart_id INTEGER NOT NULL,
                product_id INTEGER NOT NULL,
                quantity INTEGER NOT NULL,
                UNIQUE(cart_id, product_id),
                FOREIGN KEY(cart_id) REFERENCES carts(id),
                FOREIGN KEY(product_id) REFERENCES products(id)
            );)",

            R"(CREATE TABLE IF NOT EXISTS orders (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                order_number TEXT UNIQUE NOT NULL,
                customer_name TEXT NOT NULL,
                customer_email TEXT NOT NULL,
                customer_phone TEXT NOT NULL DEFAULT '',
                shipping_address TEXT NOT NULL,
                billing_address TEXT NOT NULL,
                subtotal INTEGER NOT NULL,
                shipping INTEGER NOT NULL,
                tax INTEGER NOT NULL,
                discount INTEGER NOT NULL,
                total INTEGER NOT NULL,
                currency TEXT NOT NULL,
                status TEXT NOT NULL,
                payment_method TEXT NOT NULL,
                payment_status TEXT NOT NULL,
                card_brand TEXT NOT NULL DEFAULT '',
                card_last_four TEXT NOT NULL DEFAULT '',
                transaction_id TEXT NOT NULL DEFAULT '',
                receipt TEXT NOT NULL DEFAULT '',
                created_at INTEGER NOT NULL
            );)",

            R"(CREATE TABLE IF NOT EXISTS order_items (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                order_id INTEGER NOT NULL,
                product_id INTEGER NOT NULL,
                product_name TEXT NOT NULL,
                quantity INTEGER NOT NULL,
                unit_price INTEGER NOT NULL,
                FOREIGN KEY(order_id) REFERENCES orders(id)
            );)",

            "PRAGMA user_version = 1;"};

        for(const auto& sql : statements)
        {
            auto res = db->execute(sql);
            if(!res)
            {
                spdlog::error("Failed to execute SQL: {}", sql);
                return std::unexpected(res.error());
            }
        }
    }

    return {};
}

mw::E<int64_t> Database::createProduct(const Product& product)
{
    std::lock_guard<std::mutex> guard(lock);
    const char* sql =
        "INSERT INTO products (name, description, price) VALUES (?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(product.name, product.description, product.price));
    DO_OR_RETURN(db->execute(std::move(stmt)));
    return db->lastInsertRowID();
}

mw::E<std::optional<Product>> Database::getProduct(int64_t id)
{
    std::lock_guard<std::mutex> guard(lock);
    const char* sql =
        "SELECT id, name, description, price FROM products WHERE id = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(id));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<int64_t, std::string, std::string, int64_t>(std::move(stmt))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    Product p;
    std::tie(p.id, p.name, p.description, p.price) = rows[0];
    return p;
}

mw::E<int64_t> Database::countProducts()
{
    std::lock_guard<std::mutex> guard(lock);
    return db->evalToValue<int64_t>("SELECT COUNT(*) FROM products;");
}

mw::E<int64_t> Database::createCart(const std::string& session_id)
{
    std::lock_guard<std::mutex> guard(lock);
    const char* sql = "INSERT INTO carts (session_id, created_at) VALUES (?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(session_id, mw::timeToSeconds(mw::Clock::now())));
    DO_OR_RETURN(db->execute(std::move(stmt)));
    return db->lastInsertRowID();
}

mw::E<std::optional<Cart>> Database::getCart(const std::string& session_id)
{
    std::lock_guard<std::mutex> guard(lock);
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(
                                    "SELECT id FROM carts WHERE session_id = ?;"));
    DO_OR_RETURN(stmt.bind(session_id));
    ASSIGN_OR_RETURN(auto carts, db->eval<int64_t>(std::move(stmt)));
    if(carts.empty())
    {
        return std::nullopt;
    }

    Cart cart;
    cart.id = std::get<0>(carts[0]);
    cart.session_id = session_id;

    const char* sql =
        "SELECT cart_items.product_id, products.name, cart_items.quantity, "
        "products.price FROM cart_items JOIN products "
        "ON cart_items.product_id = products.id "
        "WHERE cart_items.cart_id = ? ORDER BY cart_items.id;";
    ASSIGN_OR_RETURN(auto items_stmt, db->statementFromStr(sql));
    DO_OR_RETURN(items_stmt.bind(cart.id));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<int64_t, std::string, int, int64_t>(std::move(items_stmt))));
    for(const auto& row : rows)
    {
        CartLine line;
        std::tie(line.product_id, line.name, line.quantity, line.unit_price) =
            row;
        cart.items.push_back(std::move(line));
    }
    return cart;
}

mw::E<void> Database::addCartItem(int64_t cart_id, int64_t product_id,
                                  int quantity)
{
    std::lock_guard<std::mutex> guard(lock);
    const char* sql =
        "INSERT INTO cart_items (cart_id, product_id, quantity) "
        "VALUES (?, ?, ?) ON CONFLICT(cart_id, product_id) "
        "DO UPDATE SET quantity = quantity + excluded.quantity;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(cart_id, product_id, quantity));
    return db->execute(std::move(stmt));
}

mw::E<int64_t> Database::insertOrder(const Order& order,
                                     const std::string& cart_session)
{
    const char* sql =
        "INSERT INTO orders (order_number, customer_name, customer_email, "
        "customer_phone, shipping_address, billing_address, subtotal, "
        "shipping, tax, discount, total, currency, status, payment_method, "
        "payment_status, card_brand, card_last_four, transaction_id, "
        "receipt, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(
        order.order_number, order.customer.name, order.customer.email,
        order.customer.phone, order.shipping_address.toJSON().dump(),
        order.billing_address.toJSON().dump(), order.amount.subtotal,
        order.amount.shipping, order.amount.tax, order.amount.discount,
        order.amount.total, order.amount.currency, order.status,
        order.payment_method, order.payment_status, order.card_brand,
        order.card_last_four, order.transaction_id,
        receiptToStored(order.receipt), mw::timeToSeconds(order.created_at)));
    DO_OR_RETURN(db->execute(std::move(stmt)));
    int64_t order_id = db->lastInsertRowID();

    for(const OrderItem& item : order.items)
    {
        ASSIGN_OR_RETURN(
            auto item_stmt,
            db->statementFromStr(
                "INSERT INTO order_items (order_id, product_id, product_name, "
                "quantity, unit_price) VALUES (?, ?, ?, ?, ?);"));
        DO_OR_RETURN(item_stmt.bind(order_id, item.product_id,
                                    item.product_name, item.quantity,
                                    item.unit_price));
        DO_OR_RETURN(db->execute(std::move(item_stmt)));
    }

    ASSIGN_OR_RETURN(
        auto clear_stmt,
        db->statementFromStr("DELETE FROM cart_items WHERE cart_id = "
                             "(SELECT id FROM carts WHERE session_id = ?);"));
    DO_OR_RETURN(clear_stmt.bind(cart_session));
    DO_OR_RETURN(db->execute(std::move(clear_stmt)));
    return order_id;
}

mw::E<int64_t> Database::placeOrder(const Order& order,
                                    const std::string& cart_session)
{
    std::lock_guard<std::mutex> guard(lock);
    DO_OR_RETURN(db->execute("BEGIN IMMEDIATE;"));
    auto result = insertOrder(order, cart_session);
    if(result.has_value())
    {
        auto commit = db->execute("COMMIT;");
        if(!commit.has_value())
        {
            result = std::unexpected(commit.error());
        }
    }
    if(!result.has_value())
    {
        spdlog::error("Failed to store order {}: {}", order.order_number,
                      mw::errorMsg(result.error()));
        auto rollback = db->execute("ROLLBACK;");
        if(!rollback.has_value())
        {
            spdlog::error("Rollback failed: {}", mw::errorMsg(rollback.error()));
        }
        return std::unexpected(result.error());
    }
    return result;
}

mw::E<std::optional<Order>> Database::getOrder(const std::string& order_number)
{
    std::lock_guard<std::mutex> guard(lock);
    const char* sql =
        "SELECT id, order_number, customer_name, customer_email, "
        "customer_phone, shipping_address, billing_address, subtotal, "
        "shipping, tax, discount, total, currency, status, payment_method, "
        "payment_status, card_brand, card_last_four, transaction_id, "
        "receipt, created_at FROM orders WHERE order_number = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(order_number));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<int64_t, std::string, std::string, std::string, std::string,
                  std::string, std::string, int64_t, int64_t, int64_t, int64_t,
                  int64_t, std::string, std::string, std::string, std::string,
                  std::string, std::string, std::string, std::string,
                  int64_t>(std::move(stmt))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    ASSIGN_OR_RETURN(Order order, rowToOrder(rows[0]));

    ASSIGN_OR_RETURN(
        auto item_stmt,
        db->statementFromStr("SELECT product_id, product_name, quantity, "
                             "unit_price FROM order_items WHERE order_id = ? "
                             "ORDER BY id;"));
    DO_OR_RETURN(item_stmt.bind(order.id));
    ASSIGN_OR_RETURN(
        auto items,
        (db->eval<int64_t, std::string, int, int64_t>(std::move(item_stmt))));
    for(const auto& row : items)
    {
        OrderItem item;
        std::tie(item.product_id, item.product_name, item.quantity,
                 item.unit_price) = row;
        order.items.push_back(std::move(item));
    }
    return order;
}

mw::E<int64_t> Database::countOrders()
{
    std::lock_guard<std::mutex> guard(lock);
    return db->evalToValue<int64_t>("SELECT COUNT(*) FROM orders;");
}
