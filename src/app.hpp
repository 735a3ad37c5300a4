#pragma once

#include <memory>
#include <string>

#include <mw/error.hpp>
#include <mw/http_client.hpp>
#include <mw/http_server.hpp>

#include "database.hpp"
#include "facilitator_client.hpp"
#include "key_store.hpp"
#include "payment_processor.hpp"
#include "payment_session_store.hpp"
#include "settlement_orchestrator.hpp"
#include "signature_verifier.hpp"

// The merchant server. Settings come from Config::get() at
// construction.
class App : public mw::HTTPServer
{
public:
    App() = delete;
    App(std::unique_ptr<DatabaseInterface> db, const ListenAddress& listen,
        std::unique_ptr<mw::HTTPSessionInterface> facilitator_http,
        std::unique_ptr<CardProcessorInterface> card_processor =
            std::make_unique<MockCardProcessor>());

    // For hot reloading the trusted agents.
    KeyStore& keyStore() { return keys; }
    PaymentSessionStore& paymentSessions() { return *sessions; }

    void handleVerifySignature(const Request& req, Response& res) const;
    void handleCreateCart(Response& res);
    void handleGetCart(Response& res, const std::string& cart_session);
    void handleAddCartItem(const Request& req, Response& res,
                           const std::string& cart_session);
    void handleFinalize(const Request& req, Response& res,
                        const std::string& cart_session);
    void handleFulfill(const Request& req, Response& res,
                       const std::string& cart_session);
    void handleX402Checkout(const Request& req, Response& res,
                            const std::string& cart_session);
    void handleGetOrder(Response& res, const std::string& order_number);

protected:
    void setup() override;

private:
    // Check the agent signature headers of a request, if the server
    // requires them.
    mw::E<void> checkAgentSignature(const Request& req,
                                    const std::string& expected_tag) const;

    std::unique_ptr<DatabaseInterface> db;
    KeyStore keys;
    SignatureVerifier verifier;
    std::unique_ptr<PaymentSessionStore> sessions;
    std::unique_ptr<CardProcessorInterface> cards;
    std::unique_ptr<FacilitatorInterface> facilitator;
    SettlementOrchestrator orchestrator;
    bool require_agent_signature;
};
