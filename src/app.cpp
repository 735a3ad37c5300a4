#include "app.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <string>
#include <variant>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "crypto.hpp"
#include "types.hpp"

#define _ASSIGN_OR_RESPOND_ERROR(tmp, var, val, res, the_code)              \
    auto tmp = val;                                                         \
    if(!tmp.has_value())                                                    \
    {                                                                       \
        if(std::holds_alternative<mw::HTTPError>(tmp.error()))              \
        {                                                                   \
            const mw::HTTPError& e = std::get<mw::HTTPError>(tmp.error());  \
            respondError(res, e.code, e.msg);                               \
            return;                                                         \
        }                                                                   \
        else                                                                \
        {                                                                   \
            spdlog::error("Internal error: {}", mw::errorMsg(tmp.error())); \
            respondError(res, (the_code), mw::errorMsg(tmp.error()));       \
            return;                                                         \
        }                                                                   \
    }                                                                       \
    var = std::move(tmp).value()

// Val should be a rvalue.
#define ASSIGN_OR_RESPOND_ERROR(var, val, res, code)                         \
    _ASSIGN_OR_RESPOND_ERROR(_CONCAT_NAMES(assign_or_return_tmp, __COUNTER__), \
                             var, val, res, code)

#define _DO_OR_RESPOND_ERROR(tmp, val, res, the_code)                       \
    auto tmp = val;                                                         \
    if(!tmp.has_value())                                                    \
    {                                                                       \
        if(std::holds_alternative<mw::HTTPError>(tmp.error()))              \
        {                                                                   \
            const mw::HTTPError& e = std::get<mw::HTTPError>(tmp.error());  \
            respondError(res, e.code, e.msg);                               \
            return;                                                         \
        }                                                                   \
        else                                                                \
        {                                                                   \
            spdlog::error("Internal error: {}", mw::errorMsg(tmp.error())); \
            respondError(res, (the_code), mw::errorMsg(tmp.error()));       \
            return;                                                         \
        }                                                                   \
    }

#define DO_OR_RESPOND_ERROR(val, res, code)                                  \
    _DO_OR_RESPOND_ERROR(_CONCAT_NAMES(do_or_return_tmp, __COUNTER__),        \
                         val, res, code)

namespace {

constexpr char CONTENT_TYPE_JSON[] = "application/json";
constexpr char PAYMENT_PROVIDER[] = "merchant_payment_processor";

void respondError(httplib::Response& res, int code, const std::string& msg)
{
    res.status = code;
    res.set_content(nlohmann::json{{"detail", msg}}.dump(), CONTENT_TYPE_JSON);
}

void respondJSON(httplib::Response& res, const nlohmann::json& body,
                 int code = 200)
{
    res.status = code;
    res.set_content(body.dump(), CONTENT_TYPE_JSON);
}

mw::E<nlohmann::json> parseBody(const httplib::Request& req)
{
    nlohmann::json j = nlohmann::json::parse(req.body, nullptr, false);
    if(j.is_discarded() || !j.is_object())
    {
        return std::unexpected(
            mw::httpError(400, "Request body must be a JSON object"));
    }
    return j;
}

mw::E<std::string> requiredString(const nlohmann::json& j, const char* key)
{
    if(!j.contains(key) || !j[key].is_string())
    {
        return std::unexpected(mw::httpError(
            400, std::format("Missing or invalid field: {}", key)));
    }
    return j[key].get<std::string>();
}

mw::E<RequestContext> requestContextFromJSON(const nlohmann::json& j)
{
    RequestContext ctx;
    ASSIGN_OR_RETURN(ctx.authority, requiredString(j, "authority"));
    ASSIGN_OR_RETURN(ctx.path, requiredString(j, "path"));
    if(j.contains("expected_tag") && j["expected_tag"].is_string())
    {
        ctx.expected_tag = j["expected_tag"].get<std::string>();
    }
    if(j.contains("components") && !j["components"].is_null())
    {
        if(!j["components"].is_object())
        {
            return std::unexpected(
                mw::httpError(400, "Missing or invalid field: components"));
        }
        for(const auto& [name, value] : j["components"].items())
        {
            if(!value.is_string())
            {
                return std::unexpected(mw::httpError(
                    400, std::format("Component {} must be a string", name)));
            }
            std::string key = name;
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            ctx.components[key] = value.get<std::string>();
        }
    }
    return ctx;
}

nlohmann::json finalizeBody(const PaymentSession& session,
                            const std::string& fulfill_endpoint)
{
    nlohmann::json items = nlohmann::json::array();
    for(const CartLine& line : session.items)
    {
        items.push_back(line.toJSON());
    }
    return {
        {"error", "Payment Required"},
        {"message", "Cart finalized. Payment required to complete order."},
        {"payment_session_id", session.id},
        {"amount", session.amount.toJSON()},
        {"payment_methods",
         {{{"type", "credit_card"},
           {"provider", PAYMENT_PROVIDER},
           {"endpoint", fulfill_endpoint},
           {"method", "POST"},
           {"required_fields",
            {"payment_session_id", "card_number", "expiry_date", "cvv",
             "cardholder_name"}}}}},
        {"expires_at", timeToISO8601(session.expires_at)},
        {"order_summary",
         {{"items", items},
          {"shipping_address", session.shipping_address.toJSON()},
          {"customer", session.customer.toJSON()}}},
    };
}

} // namespace

App::App(std::unique_ptr<DatabaseInterface> db, const ListenAddress& listen,
         std::unique_ptr<mw::HTTPSessionInterface> facilitator_http,
         std::unique_ptr<CardProcessorInterface> card_processor)
        : mw::HTTPServer(listen),
          db(std::move(db)),
          keys(Config::get().trusted_agents),
          verifier(keys, std::make_unique<Crypto>(),
                   Config::get().max_signature_window_seconds),
          sessions(std::make_unique<PaymentSessionStore>(
              Config::get().pricing,
              std::chrono::seconds(Config::get().payment_session_ttl_seconds))),
          cards(std::move(card_processor)),
          facilitator(std::make_unique<FacilitatorClient>(
              Config::get().facilitator_url,
              std::chrono::seconds(Config::get().facilitator_timeout_seconds),
              std::move(facilitator_http))),
          orchestrator(*this->db, *sessions, *cards, *facilitator,
                       Config::get().merchant, Config::get().pricing),
          require_agent_signature(Config::get().require_agent_signature)
{
}

mw::E<void> App::checkAgentSignature(const Request& req,
                                     const std::string& expected_tag) const
{
    if(!require_agent_signature)
    {
        return {};
    }
    SignatureHeaders headers;
    headers.signature_agent = req.get_header_value("Signature-Agent");
    headers.signature_input = req.get_header_value("Signature-Input");
    headers.signature = req.get_header_value("Signature");

    RequestContext ctx;
    ctx.authority = req.get_header_value("Host");
    ctx.path = req.path;
    ctx.expected_tag = expected_tag;
    for(const auto& [name, value] : req.headers)
    {
        std::string key = name;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        ctx.components.emplace(std::move(key), value);
    }

    ASSIGN_OR_RETURN(std::string agent, verifier.verify(headers, ctx));
    spdlog::info("Request to {} signed by {}", req.path, agent);
    return {};
}

void App::handleVerifySignature(const Request& req, Response& res) const
{
    ASSIGN_OR_RESPOND_ERROR(nlohmann::json body, parseBody(req), res, 500);
    SignatureHeaders headers;
    ASSIGN_OR_RESPOND_ERROR(headers.signature_agent,
                            requiredString(body, "signature_agent"), res, 500);
    ASSIGN_OR_RESPOND_ERROR(headers.signature_input,
                            requiredString(body, "signature_input"), res, 500);
    ASSIGN_OR_RESPOND_ERROR(headers.signature,
                            requiredString(body, "signature"), res, 500);
    ASSIGN_OR_RESPOND_ERROR(RequestContext ctx, requestContextFromJSON(body),
                            res, 500);

    TrustDecision decision = verifier.decide(headers, ctx);
    nlohmann::json result = {{"is_trusted", decision.trusted},
                             {"message", decision.message}};
    if(decision.agent_name.has_value())
    {
        result["agent_name"] = *decision.agent_name;
    }
    respondJSON(res, result);
}

void App::handleCreateCart(Response& res)
{
    ASSIGN_OR_RESPOND_ERROR(std::string session_id, uuid4(), res, 500);
    ASSIGN_OR_RESPOND_ERROR(int64_t id, db->createCart(session_id), res, 500);
    Cart cart;
    cart.id = id;
    cart.session_id = session_id;
    spdlog::debug("Created cart {}", session_id);
    respondJSON(res, cart.toJSON());
}

void App::handleGetCart(Response& res, const std::string& cart_session)
{
    ASSIGN_OR_RESPOND_ERROR(std::optional<Cart> cart, db->getCart(cart_session),
                            res, 500);
    if(!cart.has_value())
    {
        respondError(res, 404, "Cart not found");
        return;
    }
    nlohmann::json body = cart->toJSON();
    body["subtotal"] = centsToDouble(subtotalOf(cart->items));
    respondJSON(res, body);
}

void App::handleAddCartItem(const Request& req, Response& res,
                            const std::string& cart_session)
{
    ASSIGN_OR_RESPOND_ERROR(nlohmann::json body, parseBody(req), res, 500);
    if(!body.contains("product_id") || !body["product_id"].is_number_integer())
    {
        respondError(res, 400, "Missing or invalid field: product_id");
        return;
    }
    int64_t product_id = body["product_id"].get<int64_t>();
    int quantity = 1;
    if(body.contains("quantity"))
    {
        if(!body["quantity"].is_number_integer() ||
           body["quantity"].get<int64_t>() < 1 ||
           body["quantity"].get<int64_t>() > 10000)
        {
            respondError(res, 400, "Missing or invalid field: quantity");
            return;
        }
        quantity = body["quantity"].get<int>();
    }

    ASSIGN_OR_RESPOND_ERROR(std::optional<Cart> cart, db->getCart(cart_session),
                            res, 500);
    if(!cart.has_value())
    {
        respondError(res, 404, "Cart not found");
        return;
    }
    ASSIGN_OR_RESPOND_ERROR(std::optional<Product> product,
                            db->getProduct(product_id), res, 500);
    if(!product.has_value())
    {
        respondError(res, 404, "Product not found");
        return;
    }
    DO_OR_RESPOND_ERROR(db->addCartItem(cart->id, product_id, quantity), res,
                        500);
    handleGetCart(res, cart_session);
}

void App::handleFinalize(const Request& req, Response& res,
                         const std::string& cart_session)
{
    ASSIGN_OR_RESPOND_ERROR(nlohmann::json body, parseBody(req), res, 500);
    ASSIGN_OR_RESPOND_ERROR(FinalizeRequest finalize,
                            FinalizeRequest::fromJSON(body), res, 500);
    ASSIGN_OR_RESPOND_ERROR(PaymentSession session,
                            orchestrator.finalize(cart_session, finalize), res,
                            500);

    std::string host = req.get_header_value("Host");
    std::string endpoint = std::format("http://{}/api/cart/{}/fulfill", host,
                                       cart_session);
    respondJSON(res, finalizeBody(session, endpoint), 402);
    res.set_header("X-Payment-Required", "true");
    res.set_header("X-Payment-Session-ID", session.id);
    res.set_header("X-Payment-Amount", formatCents(session.amount.total));
    res.set_header("X-Payment-Currency", session.amount.currency);
    res.set_header("X-Payment-Provider", PAYMENT_PROVIDER);
}

void App::handleFulfill(const Request& req, Response& res,
                        const std::string& cart_session)
{
    ASSIGN_OR_RESPOND_ERROR(nlohmann::json body, parseBody(req), res, 500);
    ASSIGN_OR_RESPOND_ERROR(CardFields card, CardFields::fromJSON(body), res,
                            500);
    ASSIGN_OR_RESPOND_ERROR(FulfillResult result,
                            orchestrator.fulfill(cart_session, card), res, 500);
    respondJSON(res, result.toJSON());
}

void App::handleX402Checkout(const Request& req, Response& res,
                             const std::string& cart_session)
{
    DO_OR_RESPOND_ERROR(checkAgentSignature(req, TAG_PAYER_AUTH), res, 500);
    ASSIGN_OR_RESPOND_ERROR(nlohmann::json body, parseBody(req), res, 500);
    ASSIGN_OR_RESPOND_ERROR(DelegatedCheckout checkout,
                            DelegatedCheckout::fromJSON(body), res, 500);
    ASSIGN_OR_RESPOND_ERROR(
        DelegatedResult result,
        orchestrator.checkoutDelegated(cart_session, checkout), res, 500);
    respondJSON(res, result.toJSON());
}

void App::handleGetOrder(Response& res, const std::string& order_number)
{
    ASSIGN_OR_RESPOND_ERROR(std::optional<Order> order,
                            db->getOrder(order_number), res, 500);
    if(!order.has_value())
    {
        respondError(res, 404, "Order not found");
        return;
    }
    respondJSON(res, order->toJSON());
}

void App::setup()
{
    server.Post("/api/auth/verify-signature",
                [&](const Request& req, Response& res)
    {
        handleVerifySignature(req, res);
    });

    server.Post("/api/cart", [&]([[maybe_unused]] const Request& req,
                                 Response& res)
    {
        handleCreateCart(res);
    });

    server.Get("/api/cart/:session", [&](const Request& req, Response& res)
    {
        handleGetCart(res, req.path_params.at("session"));
    });

    server.Post("/api/cart/:session/items",
                [&](const Request& req, Response& res)
    {
        handleAddCartItem(req, res, req.path_params.at("session"));
    });

    server.Post("/api/cart/:session/finalize",
                [&](const Request& req, Response& res)
    {
        handleFinalize(req, res, req.path_params.at("session"));
    });

    server.Post("/api/cart/:session/fulfill",
                [&](const Request& req, Response& res)
    {
        handleFulfill(req, res, req.path_params.at("session"));
    });

    server.Post("/api/cart/:session/x402/checkout",
                [&](const Request& req, Response& res)
    {
        handleX402Checkout(req, res, req.path_params.at("session"));
    });

    server.Get("/api/orders/:number", [&](const Request& req, Response& res)
    {
        handleGetOrder(res, req.path_params.at("number"));
    });

    server.set_exception_handler(
        [](const Request& req, Response& res, std::exception_ptr ep)
    {
        try
        {
            std::rethrow_exception(ep);
        }
        catch(const std::exception& e)
        {
            spdlog::error("Unhandled exception serving {}: {}", req.path,
                          e.what());
            respondError(res, 500, e.what());
        }
    });
}
