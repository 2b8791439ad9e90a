#include "predictor.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

RuleBasedPredictor::RuleBasedPredictor(std::shared_ptr<RedisBus> bus, std::string stream)
    : bus_(std::move(bus))
    , stream_(std::move(stream))
{}

bool RuleBasedPredictor::predict_high_chance(const FeatureVector& features) {
    return SignalAggregator::is_high_chance_basic(features);
}

nlohmann::json RuleBasedPredictor::build_trade_record(const FeatureVector& features, bool win) {
    nlohmann::json record = features.to_json();
    record["result"] = win ? 1 : 0;
    record["ts"] = util::current_iso8601();
    return record;
}

void RuleBasedPredictor::log_outcome(const FeatureVector& features, bool win) {
    auto record = build_trade_record(features, win);
    spdlog::debug("Trade record: {}", record.dump());
    if (bus_) {
        bus_->publish(stream_, record);
    }
}
