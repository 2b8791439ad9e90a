#include "broker_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

bool accepted(const nlohmann::json& body) {
    return body.is_object() && body.contains("ok") && body["ok"].is_boolean() &&
           body["ok"].get<bool>();
}

std::string rejection_reason(const nlohmann::json& body) {
    if (body.is_object() && body.contains("error") && body["error"].is_string()) {
        return body["error"].get<std::string>();
    }
    return "rejected";
}

} // namespace

HttpBrokerSession::HttpBrokerSession(std::shared_ptr<HttpClient> http,
                                     BrokerCredentials credentials,
                                     std::chrono::seconds outcome_timeout,
                                     std::chrono::seconds outcome_poll,
                                     const StopToken& stop)
    : http_(std::move(http))
    , credentials_(std::move(credentials))
    , outcome_timeout_(outcome_timeout)
    , outcome_poll_(outcome_poll)
    , stop_(stop)
{}

void HttpBrokerSession::connect() {
    nlohmann::json response;
    try {
        response = http_->post_json("/session", {
            {"email", credentials_.email},
            {"password", credentials_.password},
            {"account_type", credentials_.account_type}
        });
    } catch (const HttpError& e) {
        throw ConnectionError(std::string("broker bridge unreachable: ") + e.what());
    }

    if (!accepted(response)) {
        throw ConnectionError("broker login failed: " + rejection_reason(response));
    }

    spdlog::info("Broker session open for {} on {} balance",
                 credentials_.email, credentials_.account_type);
}

CandleWindow HttpBrokerSession::fetch_candles(const std::string& instrument,
                                              int timeframe_seconds, int count) {
    int64_t now_s = util::current_timestamp_ms() / 1000;
    std::string endpoint = "/candles?instrument=" + http_->escape(instrument) +
                           "&timeframe=" + std::to_string(timeframe_seconds) +
                           "&count=" + std::to_string(count) +
                           "&to=" + std::to_string(now_s);

    nlohmann::json body;
    try {
        body = http_->get_json(endpoint);
    } catch (const HttpError& e) {
        throw FetchError(e.what());
    }
    return parse_candles(body, instrument);
}

std::map<std::string, double> HttpBrokerSession::fetch_all_payouts() {
    try {
        return parse_payouts(http_->get_json("/payouts"));
    } catch (const HttpError& e) {
        throw FetchError(e.what());
    }
}

int64_t HttpBrokerSession::execute(double amount, const std::string& instrument,
                                   Direction direction, int expiry_minutes) {
    nlohmann::json body;
    try {
        body = http_->post_json("/orders", {
            {"amount", amount},
            {"instrument", instrument},
            {"direction", to_string(direction)},
            {"expiry_minutes", expiry_minutes}
        });
    } catch (const HttpError& e) {
        throw ExecutionError(e.what());
    }
    return parse_order(body);
}

TradeOutcome HttpBrokerSession::await_outcome(int64_t order_id) {
    auto deadline = std::chrono::steady_clock::now() + outcome_timeout_;
    std::string endpoint = "/orders/" + std::to_string(order_id);

    while (true) {
        try {
            auto outcome = parse_outcome(http_->get_json(endpoint));
            if (outcome) return *outcome;
        } catch (const HttpError& e) {
            spdlog::warn("Polling order {} failed: {}", order_id, e.what());
        }

        if (std::chrono::steady_clock::now() + outcome_poll_ > deadline) {
            throw TimeoutError("no result for order " + std::to_string(order_id) +
                               " after " + std::to_string(outcome_timeout_.count()) + "s");
        }
        if (stop_.wait_for(outcome_poll_)) {
            throw TimeoutError("stop requested while awaiting order " + std::to_string(order_id));
        }
    }
}

CandleWindow HttpBrokerSession::parse_candles(const nlohmann::json& body,
                                              const std::string& instrument) {
    if (!body.is_array()) {
        throw FetchError("candle payload for " + instrument + " is not an array");
    }

    CandleWindow window;
    window.instrument = instrument;
    window.candles.reserve(body.size());

    try {
        for (const auto& raw : body) {
            // Venue reports low/high as min/max
            Candle c;
            c.timestamp = raw.at("from").get<int64_t>();
            c.open = raw.at("open").get<double>();
            c.close = raw.at("close").get<double>();
            c.low = raw.at("min").get<double>();
            c.high = raw.at("max").get<double>();
            c.volume = raw.value("volume", 0.0);
            window.candles.push_back(c);
        }
    } catch (const nlohmann::json::exception& e) {
        throw FetchError("malformed candle for " + instrument + ": " + e.what());
    }

    std::sort(window.candles.begin(), window.candles.end(),
              [](const Candle& a, const Candle& b) { return a.timestamp < b.timestamp; });

    if (!window.is_well_formed()) {
        throw FetchError("candle window for " + instrument + " has non-finite values or repeated timestamps");
    }
    return window;
}

std::map<std::string, double> HttpBrokerSession::parse_payouts(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw FetchError("payout payload is not an object");
    }

    std::map<std::string, double> payouts;
    for (const auto& [instrument, offers] : body.items()) {
        // Short-expiry (turbo) payout only
        if (offers.is_object() && offers.contains("turbo") && offers["turbo"].is_number()) {
            payouts[instrument] = offers["turbo"].get<double>();
        }
    }
    return payouts;
}

int64_t HttpBrokerSession::parse_order(const nlohmann::json& body) {
    if (!accepted(body)) {
        throw ExecutionError("order not accepted: " + rejection_reason(body));
    }
    if (!body.contains("order_id") || !body["order_id"].is_number_integer()) {
        throw ExecutionError("order accepted without an order id");
    }
    return body["order_id"].get<int64_t>();
}

std::optional<TradeOutcome> HttpBrokerSession::parse_outcome(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("status") || !body["status"].is_string()) {
        throw ExecutionError("order status payload is malformed: " + body.dump());
    }
    if (body["status"].get<std::string>() != "closed") {
        return std::nullopt;
    }
    if (!body.contains("win") || !body["win"].is_boolean()) {
        throw ExecutionError("closed order without a boolean win flag: " + body.dump());
    }
    return body["win"].get<bool>() ? TradeOutcome::Win : TradeOutcome::Loss;
}
