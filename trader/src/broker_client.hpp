#pragma once

#include "collaborators.hpp"
#include "http_client.hpp"
#include "stop_token.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>

struct BrokerCredentials {
    std::string email;
    std::string password;
    std::string account_type; // PRACTICE or REAL
};

// BrokerSession backed by the broker bridge REST API
class HttpBrokerSession : public BrokerSession {
public:
    HttpBrokerSession(std::shared_ptr<HttpClient> http,
                      BrokerCredentials credentials,
                      std::chrono::seconds outcome_timeout,
                      std::chrono::seconds outcome_poll,
                      const StopToken& stop);

    void connect() override;
    CandleWindow fetch_candles(const std::string& instrument,
                               int timeframe_seconds, int count) override;
    std::map<std::string, double> fetch_all_payouts() override;
    int64_t execute(double amount, const std::string& instrument,
                    Direction direction, int expiry_minutes) override;
    // Polls until the order closes; a stop request or the timeout raises TimeoutError
    TradeOutcome await_outcome(int64_t order_id) override;

    // Response decoding, throwing FetchError / ExecutionError on bad payloads.
    // Non-boolean ok/win flags count as malformed.
    static CandleWindow parse_candles(const nlohmann::json& body, const std::string& instrument);
    static std::map<std::string, double> parse_payouts(const nlohmann::json& body);
    static int64_t parse_order(const nlohmann::json& body);
    // nullopt while the order is still open
    static std::optional<TradeOutcome> parse_outcome(const nlohmann::json& body);

private:
    std::shared_ptr<HttpClient> http_;
    BrokerCredentials credentials_;
    std::chrono::seconds outcome_timeout_;
    std::chrono::seconds outcome_poll_;
    const StopToken& stop_;
};
