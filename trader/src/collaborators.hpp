#pragma once

#include "candle.hpp"
#include "signals.hpp"
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

// Session could not be established. Fatal at startup; raised mid-scan it only
// fails the instrument being scanned.
class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The following are recoverable: the instrument is skipped for the cycle.
// A failed or unresolved order is booked as a loss.
class FetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ExecutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class TradeOutcome {
    Win,
    Loss
};

class BrokerSession {
public:
    virtual ~BrokerSession() = default;

    virtual void connect() = 0;
    virtual CandleWindow fetch_candles(const std::string& instrument,
                                       int timeframe_seconds, int count) = 0;
    virtual std::map<std::string, double> fetch_all_payouts() = 0;
    virtual int64_t execute(double amount, const std::string& instrument,
                            Direction direction, int expiry_minutes) = 0;
    virtual TradeOutcome await_outcome(int64_t order_id) = 0;
};

// Money management: eligibility, stake sizing and outcome feedback
class StakeManager {
public:
    virtual ~StakeManager() = default;

    virtual bool can_trade(const std::string& instrument) = 0;
    virtual double next_stake(const std::string& instrument, bool high_chance, double payout) = 0;
    virtual void register_outcome(const std::string& instrument, bool win) = 0;
};

class TradePredictor {
public:
    virtual ~TradePredictor() = default;

    virtual bool predict_high_chance(const FeatureVector& features) = 0;
    virtual void log_outcome(const FeatureVector& features, bool win) = 0;
};

class NewsGate {
public:
    virtual ~NewsGate() = default;

    virtual bool has_imminent_high_impact_event() = 0;
};
