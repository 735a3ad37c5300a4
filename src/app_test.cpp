#include <chrono>
#include <memory>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <mw/http_client.hpp>
#include <mw/http_client_mock.hpp>
#include <mw/utils.hpp>
#include <nlohmann/json.hpp>

#include <httplib.h>

#include "app.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "database.hpp"
#include "database_mock.hpp"
#include "signature_codec.hpp"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

constexpr char BASE_URL[] = "http://localhost:18080";
constexpr char AUTHORITY[] = "localhost:18080";
constexpr char AGENT_ID[] = "https://agent.example.com";

constexpr char SETTLE_RESPONSE[] = R"({
    "transaction_receipt": {
        "receipt_id": "rcpt_app", "transaction_id": "txn_app",
        "payment_rail_used": "card", "amount": 123.75,
        "processing_fee": 3.59, "net_amount": 120.16
    },
    "remaining_delegation_limit": 376.25
})";

mw::E<const mw::HTTPResponse*> postJSON(mw::HTTPSession& client,
                                        const std::string& path,
                                        const nlohmann::json& body)
{
    mw::HTTPRequest req(std::string(BASE_URL) + path);
    req.setPayload(body.dump());
    req.setContentType("application/json");
    return client.post(req);
}

nlohmann::json bodyOf(const mw::HTTPResponse* res)
{
    return nlohmann::json::parse(res->payloadAsStr());
}

nlohmann::json finalizeRequest()
{
    return {{"customer_info", {{"name", "Alice"}, {"email", "alice@example.com"}}},
            {"shipping_address",
             {{"street", "1 Main St"},
              {"city", "Springfield"},
              {"state", "IL"},
              {"postal_code", "62701"},
              {"country", "US"}}}};
}

} // namespace

class AppTest : public ::testing::Test
{
protected:
    static void SetUpTestSuite()
    {
        agent_keys = *Crypto().generateKeyPair(SignatureAlgorithm::ED25519);
    }

    void SetUp() override
    {
        Config::get().db_path = ":memory:";
        Config::get().port = 18080;
        Config::get().facilitator_url = "http://facilitator.test";
        Config::get().facilitator_timeout_seconds = 2;

        TrustedAgentKey agent;
        agent.agent_id = AGENT_ID;
        agent.algorithm = SignatureAlgorithm::ED25519;
        agent.public_key = agent_keys.public_key;
        agent.display_name = "Test Agent";
        Config::get().trusted_agents = {agent};

        settle_response = std::make_shared<mw::HTTPResponse>();
        settle_response->status = 200;
        for(char c : std::string(SETTLE_RESPONSE))
        {
            settle_response->payload.push_back(std::byte(c));
        }
    }

    void TearDown() override
    {
        Config::get() = Config();
    }

    // A real in-memory database with one product at $50.
    std::unique_ptr<Database> seededDatabase()
    {
        auto db = std::make_unique<Database>(":memory:");
        EXPECT_TRUE(db->init().has_value());
        Product p;
        p.name = "Widget";
        p.description = "A widget";
        p.price = 5000;
        EXPECT_TRUE(db->createProduct(p).has_value());
        return db;
    }

    std::unique_ptr<NiceMock<mw::HTTPSessionMock>> facilitatorHTTP()
    {
        auto http = std::make_unique<NiceMock<mw::HTTPSessionMock>>();
        auto resp = settle_response;
        ON_CALL(*http, post(testing::A<const mw::HTTPRequest&>()))
            .WillByDefault(Invoke(
                [resp](const mw::HTTPRequest&) -> mw::E<const mw::HTTPResponse*>
                {
                    return resp.get();
                }));
        return http;
    }

    // Create a cart holding two widgets and return its session ID.
    std::string makeCart(mw::HTTPSession& client)
    {
        auto created = postJSON(client, "/api/cart", nlohmann::json::object());
        EXPECT_TRUE(created.has_value());
        EXPECT_EQ((*created)->status, 200);
        std::string session = bodyOf(*created)["session_id"];

        auto added = postJSON(client, "/api/cart/" + session + "/items",
                              {{"product_id", 1}, {"quantity", 2}});
        EXPECT_TRUE(added.has_value());
        EXPECT_EQ((*added)->status, 200);
        return session;
    }

    SignatureHeaders signCheckout(const std::string& cart_session) const
    {
        int64_t now = mw::timeToSeconds(mw::Clock::now());
        SignatureContext ctx;
        ctx.agent_id = AGENT_ID;
        ctx.alg = "ed25519";
        ctx.key_id = "agent-key";
        ctx.created = now - 10;
        ctx.expires = now + 300;
        ctx.nonce = "nonce-1";
        ctx.tag = TAG_PAYER_AUTH;

        RequestContext req;
        req.authority = AUTHORITY;
        req.path = "/api/cart/" + cart_session + "/x402/checkout";
        auto headers = signature_codec::sign(ctx, req, agent_keys.private_key,
                                             Crypto());
        EXPECT_TRUE(headers.has_value());
        return *headers;
    }

    static KeyPair agent_keys;
    std::shared_ptr<mw::HTTPResponse> settle_response;
    mw::HTTPServer::ListenAddress listen = mw::IPSocketInfo{"127.0.0.1", 18080};
};

KeyPair AppTest::agent_keys;

TEST_F(AppTest, CardCheckout)
{
    App app(seededDatabase(), listen, facilitatorHTTP());
    auto start_res = app.start();
    ASSERT_TRUE(start_res) << "Failed to start app: "
                           << mw::errorMsg(start_res.error());

    {
        mw::HTTPSession client;
        std::string session = makeCart(client);

        auto cart = client.get(std::string(BASE_URL) + "/api/cart/" + session);
        ASSERT_TRUE(cart.has_value());
        EXPECT_EQ((*cart)->status, 200);
        nlohmann::json cart_body = bodyOf(*cart);
        ASSERT_EQ(cart_body["items"].size(), 1);
        EXPECT_EQ(cart_body["items"][0]["quantity"], 2);
        EXPECT_DOUBLE_EQ(cart_body["subtotal"].get<double>(), 100.0);

        auto finalized = postJSON(client, "/api/cart/" + session + "/finalize",
                                  finalizeRequest());
        ASSERT_TRUE(finalized.has_value());
        EXPECT_EQ((*finalized)->status, 402);
        nlohmann::json quote = bodyOf(*finalized);
        std::string payment_session = quote["payment_session_id"];
        EXPECT_DOUBLE_EQ(quote["amount"]["total"].get<double>(), 108.0);
        EXPECT_EQ(quote["payment_methods"][0]["endpoint"],
                  std::string(BASE_URL) + "/api/cart/" + session + "/fulfill");

        auto fulfilled = postJSON(client, "/api/cart/" + session + "/fulfill",
                                  {{"payment_session_id", payment_session},
                                   {"card_number", "4242424242424242"},
                                   {"expiry_date", "12/99"},
                                   {"cvv", "123"},
                                   {"cardholder_name", "Alice"}});
        ASSERT_TRUE(fulfilled.has_value());
        EXPECT_EQ((*fulfilled)->status, 200);
        nlohmann::json result = bodyOf(*fulfilled);
        EXPECT_EQ(result["status"], "fulfilled");
        std::string order_number = result["order"]["order_number"];

        auto order = client.get(std::string(BASE_URL) + "/api/orders/" +
                                order_number);
        ASSERT_TRUE(order.has_value());
        EXPECT_EQ((*order)->status, 200);
        EXPECT_EQ(bodyOf(*order)["payment_method"], "credit_card");

        // The session is gone once used.
        auto again = postJSON(client, "/api/cart/" + session + "/fulfill",
                              {{"payment_session_id", payment_session},
                               {"card_number", "4242424242424242"},
                               {"expiry_date", "12/99"},
                               {"cvv", "123"},
                               {"cardholder_name", "Alice"}});
        ASSERT_TRUE(again.has_value());
        EXPECT_EQ((*again)->status, 404);
    }

    app.stop();
    app.wait();
}

TEST_F(AppTest, VerifySignatureEndpoint)
{
    App app(seededDatabase(), listen, facilitatorHTTP());
    auto start_res = app.start();
    ASSERT_TRUE(start_res) << "Failed to start app: "
                           << mw::errorMsg(start_res.error());

    {
        mw::HTTPSession client;
        SignatureHeaders headers = signCheckout("abc");
        nlohmann::json body = {
            {"signature_agent", headers.signature_agent},
            {"signature_input", headers.signature_input},
            {"signature", headers.signature},
            {"authority", AUTHORITY},
            {"path", "/api/cart/abc/x402/checkout"}};

        auto res = postJSON(client, "/api/auth/verify-signature", body);
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ((*res)->status, 200);
        nlohmann::json decision = bodyOf(*res);
        EXPECT_EQ(decision["is_trusted"], true);
        EXPECT_EQ(decision["agent_name"], "Test Agent");
        EXPECT_EQ(decision["message"], "Verified agent: Test Agent");

        body["path"] = "/api/cart/xyz/x402/checkout";
        res = postJSON(client, "/api/auth/verify-signature", body);
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ((*res)->status, 200);
        decision = bodyOf(*res);
        EXPECT_EQ(decision["is_trusted"], false);
        EXPECT_EQ(decision["message"], "invalid signature");
        EXPECT_FALSE(decision.contains("agent_name"));

        res = postJSON(client, "/api/auth/verify-signature",
                       {{"signature_agent", "x"}});
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ((*res)->status, 400);
    }

    app.stop();
    app.wait();
}

TEST_F(AppTest, SignedX402Checkout)
{
    Config::get().require_agent_signature = true;
    App app(seededDatabase(), listen, facilitatorHTTP());
    auto start_res = app.start();
    ASSERT_TRUE(start_res) << "Failed to start app: "
                           << mw::errorMsg(start_res.error());

    {
        mw::HTTPSession client;
        std::string session = makeCart(client);
        std::string path = "/api/cart/" + session + "/x402/checkout";
        nlohmann::json body = {{"delegation_token", "token-1"},
                               {"agent_id", "agent-7"}};

        // Unsigned requests are turned away.
        auto unsigned_res = postJSON(client, path, body);
        ASSERT_TRUE(unsigned_res.has_value());
        EXPECT_EQ((*unsigned_res)->status, 400);
        EXPECT_EQ(bodyOf(*unsigned_res)["detail"], "invalid signature format");

        // A signature for another cart does not verify here.
        SignatureHeaders other = signCheckout("other-cart");
        mw::HTTPRequest wrong(std::string(BASE_URL) + path);
        wrong.setPayload(body.dump());
        wrong.setContentType("application/json");
        wrong.addHeader("Signature-Agent", other.signature_agent);
        wrong.addHeader("Signature-Input", other.signature_input);
        wrong.addHeader("Signature", other.signature);
        auto wrong_res = client.post(wrong);
        ASSERT_TRUE(wrong_res.has_value());
        EXPECT_EQ((*wrong_res)->status, 401);

        SignatureHeaders headers = signCheckout(session);
        mw::HTTPRequest req(std::string(BASE_URL) + path);
        req.setPayload(body.dump());
        req.setContentType("application/json");
        req.addHeader("Signature-Agent", headers.signature_agent);
        req.addHeader("Signature-Input", headers.signature_input);
        req.addHeader("Signature", headers.signature);
        auto res = client.post(req);
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ((*res)->status, 200) << (*res)->payloadAsStr();
        nlohmann::json result = bodyOf(*res);
        EXPECT_EQ(result["status"], "success");
        EXPECT_EQ(result["payment"]["receipt_id"], "rcpt_app");
        EXPECT_EQ(result["delegation"]["agent_id"], "agent-7");

        auto cart = client.get(std::string(BASE_URL) + "/api/cart/" + session);
        ASSERT_TRUE(cart.has_value());
        EXPECT_TRUE(bodyOf(*cart)["items"].empty());
    }

    app.stop();
    app.wait();
}

TEST_F(AppTest, NotFound)
{
    auto db_mock = std::make_unique<NiceMock<DatabaseMock>>();
    auto* db_ptr = db_mock.get();
    EXPECT_CALL(*db_ptr, getCart(_))
        .WillRepeatedly(Return(std::optional<Cart>()));
    EXPECT_CALL(*db_ptr, getOrder(_))
        .WillRepeatedly(Return(std::optional<Order>()));

    App app(std::move(db_mock), listen, facilitatorHTTP());
    auto start_res = app.start();
    ASSERT_TRUE(start_res) << "Failed to start app: "
                           << mw::errorMsg(start_res.error());

    {
        mw::HTTPSession client;
        auto cart = client.get(std::string(BASE_URL) + "/api/cart/nope");
        ASSERT_TRUE(cart.has_value());
        EXPECT_EQ((*cart)->status, 404);
        EXPECT_EQ(bodyOf(*cart)["detail"], "Cart not found");

        auto order = client.get(std::string(BASE_URL) + "/api/orders/nope");
        ASSERT_TRUE(order.has_value());
        EXPECT_EQ((*order)->status, 404);
        EXPECT_EQ(bodyOf(*order)["detail"], "Order not found");

        auto item = postJSON(client, "/api/cart/nope/items",
                             {{"product_id", 1}});
        ASSERT_TRUE(item.has_value());
        EXPECT_EQ((*item)->status, 404);

        auto finalized = postJSON(client, "/api/cart/nope/finalize",
                                  finalizeRequest());
        ASSERT_TRUE(finalized.has_value());
        EXPECT_EQ((*finalized)->status, 404);
    }

    app.stop();
    app.wait();
}

TEST_F(AppTest, DatabaseFailureIs500)
{
    auto db_mock = std::make_unique<NiceMock<DatabaseMock>>();
    auto* db_ptr = db_mock.get();
    EXPECT_CALL(*db_ptr, createCart(_))
        .WillOnce(Return(std::unexpected(mw::runtimeError("disk full"))));

    App app(std::move(db_mock), listen, facilitatorHTTP());
    auto start_res = app.start();
    ASSERT_TRUE(start_res) << "Failed to start app: "
                           << mw::errorMsg(start_res.error());

    {
        mw::HTTPSession client;
        auto res = postJSON(client, "/api/cart", nlohmann::json::object());
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ((*res)->status, 500);
        EXPECT_THAT((*res)->payloadAsStr(), HasSubstr("disk full"));
    }

    app.stop();
    app.wait();
}

TEST_F(AppTest, FinalizeSetsPaymentHeaders)
{
    auto db_mock = std::make_unique<NiceMock<DatabaseMock>>();
    Cart cart;
    cart.id = 1;
    cart.session_id = "cart-1";
    CartLine line;
    line.product_id = 1;
    line.name = "Widget";
    line.quantity = 2;
    line.unit_price = 5000;
    cart.items.push_back(line);
    EXPECT_CALL(*db_mock, getCart("cart-1"))
        .WillOnce(Return(std::make_optional(cart)));

    App app(std::move(db_mock), listen, facilitatorHTTP());
    httplib::Request req;
    req.body = finalizeRequest().dump();
    req.headers.emplace("Host", "shop.example.com");
    httplib::Response res;
    app.handleFinalize(req, res, "cart-1");

    EXPECT_EQ(res.status, 402);
    nlohmann::json body = nlohmann::json::parse(res.body);
    EXPECT_EQ(body["error"], "Payment Required");
    EXPECT_EQ(body["payment_methods"][0]["endpoint"],
              "http://shop.example.com/api/cart/cart-1/fulfill");
    EXPECT_EQ(res.get_header_value("X-Payment-Required"), "true");
    EXPECT_EQ(res.get_header_value("X-Payment-Session-ID"),
              body["payment_session_id"].get<std::string>());
    EXPECT_EQ(res.get_header_value("X-Payment-Amount"), "108.00");
    EXPECT_EQ(res.get_header_value("X-Payment-Currency"), "USD");
    EXPECT_EQ(app.paymentSessions().size(), 1);
}

TEST_F(AppTest, UnsignedX402CheckoutByDefault)
{
    ASSERT_FALSE(Config::get().require_agent_signature);
    App app(seededDatabase(), listen, facilitatorHTTP());
    auto start_res = app.start();
    ASSERT_TRUE(start_res) << "Failed to start app: "
                           << mw::errorMsg(start_res.error());

    {
        mw::HTTPSession client;
        std::string session = makeCart(client);
        auto res = postJSON(client, "/api/cart/" + session + "/x402/checkout",
                            {{"delegation_token", "token-1"},
                             {"agent_id", "agent-7"}});
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ((*res)->status, 200) << (*res)->payloadAsStr();
        EXPECT_EQ(bodyOf(*res)["status"], "success");
    }

    app.stop();
    app.wait();
}
