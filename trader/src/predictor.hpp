#pragma once

#include "collaborators.hpp"
#include "redis_bus.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

// Rates a setup with the composite breakout/pattern/volume/trend rule and
// journals every trade outcome for offline model training.
class RuleBasedPredictor : public TradePredictor {
public:
    // bus may be null, in which case outcomes are only logged
    RuleBasedPredictor(std::shared_ptr<RedisBus> bus, std::string stream);

    bool predict_high_chance(const FeatureVector& features) override;
    void log_outcome(const FeatureVector& features, bool win) override;

    static nlohmann::json build_trade_record(const FeatureVector& features, bool win);

private:
    std::shared_ptr<RedisBus> bus_;
    std::string stream_;
};
