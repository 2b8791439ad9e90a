#include <catch2/catch_test_macros.hpp>
#include "../src/broker_client.hpp"
#include "../src/predictor.hpp"
#include <chrono>

TEST_CASE("Candle payload decoding", "[broker]") {
    SECTION("Venue min/max map to low/high and rows are sorted") {
        nlohmann::json body = nlohmann::json::array({
            {{"from", 120}, {"open", 1.2}, {"close", 1.3}, {"min", 1.1}, {"max", 1.4}, {"volume", 30}},
            {{"from", 60}, {"open", 1.0}, {"close", 1.2}, {"min", 0.9}, {"max", 1.25}, {"volume", 20}}
        });

        auto w = HttpBrokerSession::parse_candles(body, "EURUSD");
        REQUIRE(w.instrument == "EURUSD");
        REQUIRE(w.size() == 2);
        REQUIRE(w.candles[0].timestamp == 60);
        REQUIRE(w.candles[0].low == 0.9);
        REQUIRE(w.candles[0].high == 1.25);
        REQUIRE(w.last().volume == 30.0);
    }

    SECTION("Missing volume defaults to zero") {
        nlohmann::json body = nlohmann::json::array({
            {{"from", 60}, {"open", 1.0}, {"close", 1.2}, {"min", 0.9}, {"max", 1.25}}
        });
        REQUIRE(HttpBrokerSession::parse_candles(body, "EURUSD").last().volume == 0.0);
    }

    SECTION("Repeated timestamps are rejected") {
        nlohmann::json body = nlohmann::json::array({
            {{"from", 60}, {"open", 1.0}, {"close", 1.2}, {"min", 0.9}, {"max", 1.25}},
            {{"from", 60}, {"open", 1.0}, {"close", 1.2}, {"min", 0.9}, {"max", 1.25}}
        });
        REQUIRE_THROWS_AS(HttpBrokerSession::parse_candles(body, "EURUSD"), FetchError);
    }

    SECTION("Missing price fields are rejected") {
        nlohmann::json body = nlohmann::json::array({{{"from", 60}, {"open", 1.0}}});
        REQUIRE_THROWS_AS(HttpBrokerSession::parse_candles(body, "EURUSD"), FetchError);
    }

    SECTION("Non-array payload is rejected") {
        REQUIRE_THROWS_AS(HttpBrokerSession::parse_candles({{"error", "busy"}}, "EURUSD"), FetchError);
    }

    SECTION("Empty array is a valid, empty window") {
        REQUIRE(HttpBrokerSession::parse_candles(nlohmann::json::array(), "EURUSD").empty());
    }
}

TEST_CASE("Payout table decoding", "[broker]") {
    nlohmann::json body = {
        {"EURUSD", {{"turbo", 0.87}, {"binary", 0.82}}},
        {"GBPUSD", {{"binary", 0.80}}},
        {"USDJPY", "closed"}
    };

    auto payouts = HttpBrokerSession::parse_payouts(body);
    REQUIRE(payouts.size() == 1);
    REQUIRE(payouts.at("EURUSD") == 0.87);

    REQUIRE_THROWS_AS(HttpBrokerSession::parse_payouts(nlohmann::json::array()), FetchError);
}

TEST_CASE("Order and outcome decoding", "[broker]") {
    SECTION("Accepted order returns its id") {
        REQUIRE(HttpBrokerSession::parse_order({{"ok", true}, {"order_id", 4411}}) == 4411);
    }

    SECTION("Rejected order raises") {
        REQUIRE_THROWS_AS(HttpBrokerSession::parse_order({{"ok", false}, {"error", "asset closed"}}),
                          ExecutionError);
        REQUIRE_THROWS_AS(HttpBrokerSession::parse_order({{"ok", true}}), ExecutionError);
    }

    SECTION("Non-boolean acceptance flag is a rejection") {
        REQUIRE_THROWS_AS(HttpBrokerSession::parse_order({{"ok", 1}, {"order_id", 7}}),
                          ExecutionError);
        REQUIRE_THROWS_AS(HttpBrokerSession::parse_order({{"ok", false}, {"error", 42}}),
                          ExecutionError);
    }

    SECTION("Open orders have no outcome yet") {
        REQUIRE_FALSE(HttpBrokerSession::parse_outcome({{"status", "open"}}).has_value());
    }

    SECTION("Closed orders report win or loss") {
        REQUIRE(HttpBrokerSession::parse_outcome({{"status", "closed"}, {"win", true}}) == TradeOutcome::Win);
        REQUIRE(HttpBrokerSession::parse_outcome({{"status", "closed"}, {"win", false}}) == TradeOutcome::Loss);
    }

    SECTION("Malformed outcome payloads raise execution errors") {
        REQUIRE_THROWS_AS(HttpBrokerSession::parse_outcome({{"status", "closed"}, {"win", 1}}),
                          ExecutionError);
        REQUIRE_THROWS_AS(HttpBrokerSession::parse_outcome({{"status", "closed"}}), ExecutionError);
        REQUIRE_THROWS_AS(HttpBrokerSession::parse_outcome({{"status", 3}}), ExecutionError);
        REQUIRE_THROWS_AS(HttpBrokerSession::parse_outcome(nlohmann::json::array()), ExecutionError);
    }
}

TEST_CASE("Outcome polling honors the stop token", "[broker]") {
    StopToken stop;
    stop.request_stop();
    HttpBrokerSession broker(std::make_shared<HttpClient>("http://127.0.0.1:1", 200),
                             BrokerCredentials{"trader@example.com", "secret", "PRACTICE"},
                             std::chrono::seconds(120), std::chrono::seconds(2), stop);

    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(broker.await_outcome(1), TimeoutError);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
}

TEST_CASE("Trade journal record", "[predictor]") {
    FeatureVector f{"CDL_HAMMER", Breakout::Up, Trend::Up, 1.8, 0.85};

    auto record = RuleBasedPredictor::build_trade_record(f, true);
    REQUIRE(record["pattern_name"] == "CDL_HAMMER");
    REQUIRE(record["breakout"] == "breakout_up");
    REQUIRE(record["result"] == 1);
    REQUIRE(record.contains("ts"));

    SECTION("Predictor uses the composite rule") {
        RuleBasedPredictor predictor(nullptr, "optionscout.trades");
        REQUIRE(predictor.predict_high_chance(f));
        FeatureVector quiet{f.pattern_name, f.breakout, f.trend, 0.9, f.payout};
        REQUIRE_FALSE(predictor.predict_high_chance(quiet));
        REQUIRE_NOTHROW(predictor.log_outcome(f, false));
    }
}
