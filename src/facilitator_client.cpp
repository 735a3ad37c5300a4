#include "facilitator_client.hpp"

#include <atomic>
#include <format>
#include <future>
#include <thread>

#include <spdlog/spdlog.h>

namespace {

constexpr char SETTLE_PATH[] = "/x402/settle";

auto unavailable(std::string_view reason)
{
    return std::unexpected(mw::httpError(
        503, std::format("Payment Facilitator unavailable: {}", reason)));
}

} // namespace

nlohmann::json SettlementRequest::toJSON() const
{
    nlohmann::json item_list = nlohmann::json::array();
    for(const CartLine& line : items)
    {
        item_list.push_back({{"product_id", line.product_id},
                             {"name", line.name},
                             {"quantity", line.quantity},
                             {"price", centsToDouble(line.unit_price)}});
    }
    return {{"delegation_token", delegation_token},
            {"merchant_id", merchant_id},
            {"merchant_name", merchant_name},
            {"cart_id", cart_id},
            {"amount", centsToDouble(amount)},
            {"currency", currency},
            {"items", item_list},
            {"merchant_signature", merchant_signature}};
}

FacilitatorClient::FacilitatorClient(
    const std::string& base_url, std::chrono::milliseconds timeout,
    std::unique_ptr<mw::HTTPSessionInterface> http_client)
    : base_url(base_url), timeout(timeout),
      http_client(std::move(http_client)),
      http_lock(std::make_shared<std::mutex>())
{
    while(this->base_url.ends_with('/'))
    {
        this->base_url.pop_back();
    }
}

mw::E<FacilitatorClient::Reply>
FacilitatorClient::postWithTimeout(const mw::HTTPRequest& req)
{
    auto promise = std::make_shared<std::promise<mw::E<Reply>>>();
    std::future<mw::E<Reply>> future = promise->get_future();
    // Set once the caller has given up. A request still queued behind
    // the lock must not be sent after that.
    auto abandoned = std::make_shared<std::atomic<bool>>(false);

    // The session has no deadline of its own, so the request runs on
    // its own thread and we stop waiting for it after the timeout.
    std::thread([session = http_client, lock = http_lock, req, promise,
                 abandoned]()
    {
        std::lock_guard<std::mutex> guard(*lock);
        if(abandoned->load())
        {
            spdlog::warn("Dropping settlement request to {}, caller timed out",
                         req.url);
            promise->set_value(std::unexpected(
                mw::runtimeError("request abandoned before it was sent")));
            return;
        }
        auto res = session->post(req);
        if(!res.has_value())
        {
            promise->set_value(std::unexpected(res.error()));
            return;
        }
        promise->set_value(Reply{(*res)->status, (*res)->payloadAsStr()});
    }).detach();

    if(future.wait_for(timeout) != std::future_status::ready)
    {
        abandoned->store(true);
        return unavailable(
            std::format("no response within {}ms", timeout.count()));
    }
    auto reply = future.get();
    if(!reply.has_value())
    {
        return unavailable(mw::errorMsg(reply.error()));
    }
    return *std::move(reply);
}

mw::E<SettlementReceipt> FacilitatorClient::settle(const SettlementRequest& req)
{
    mw::HTTPRequest http_req(base_url + SETTLE_PATH);
    http_req.setPayload(req.toJSON().dump());
    http_req.setContentType("application/json");

    spdlog::info("Requesting settlement of {} {} for cart {}",
                 formatCents(req.amount), req.currency, req.cart_id);
    auto reply = postWithTimeout(http_req);
    if(!reply.has_value())
    {
        spdlog::error("Settlement for cart {} failed: {}", req.cart_id,
                      mw::errorMsg(reply.error()));
        return std::unexpected(reply.error());
    }
    if(reply->status != 200)
    {
        spdlog::warn("Facilitator refused settlement for cart {} ({}): {}",
                     req.cart_id, reply->status, reply->body);
        return std::unexpected(mw::httpError(
            402, std::format("Payment settlement failed: {}", reply->body)));
    }

    nlohmann::json body = nlohmann::json::parse(reply->body, nullptr, false);
    if(body.is_discarded())
    {
        return unavailable("invalid JSON in settlement response");
    }
    auto receipt = SettlementReceipt::fromSettleResponse(body);
    if(!receipt.has_value())
    {
        return unavailable(mw::errorMsg(receipt.error()));
    }
    spdlog::info("Cart {} settled, receipt {}", req.cart_id,
                 receipt->receipt_id);
    return receipt;
}
