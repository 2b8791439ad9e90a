#include "stake_manager.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

std::string to_string(StakeStrategy strategy) {
    return strategy == StakeStrategy::Soros ? "soros" : "martingale";
}

StakeStrategy parse_stake_strategy(const std::string& name) {
    std::string upper = util::to_upper(name);
    if (upper == "MARTINGALE") return StakeStrategy::Martingale;
    if (upper == "SOROS") return StakeStrategy::Soros;
    throw std::invalid_argument("unknown stake strategy: " + name);
}

RiskManager::RiskManager(StakePolicy policy, Clock now_ms)
    : policy_(policy)
    , now_ms_(std::move(now_ms))
{}

bool RiskManager::can_trade(const std::string& instrument) {
    auto it = records_.find(instrument);
    if (it == records_.end()) return true;

    return now_ms_() >= it->second.cooldown_until_ms;
}

bool RiskManager::sizes_with_soros(double payout) const {
    if (policy_.strategy == StakeStrategy::Soros) return true;
    return policy_.use_soros_if_low_payout && payout < policy_.min_payout_for_soros;
}

double RiskManager::next_stake(const std::string& instrument, bool high_chance, double payout) {
    auto& rec = records_[instrument];

    double amount = policy_.base_stake;
    bool soros = sizes_with_soros(payout);
    if (soros) {
        if (rec.soros_wins > 0) amount = rec.soros_stake;
    } else if (high_chance) {
        amount = policy_.base_stake * std::pow(policy_.martingale_factor, rec.step);
    }

    rec.last_stake = amount;
    rec.last_payout = payout;
    rec.last_was_soros = soros;
    return amount;
}

void RiskManager::register_outcome(const std::string& instrument, bool win) {
    auto& rec = records_[instrument];

    if (win) {
        rec.step = 0;
        rec.consecutive_losses = 0;

        if (rec.last_was_soros && rec.soros_wins < policy_.soros_level) {
            rec.soros_wins++;
            rec.soros_stake = rec.last_stake * (1.0 + rec.last_payout);
        } else {
            // Cycle complete, bank the profit
            rec.soros_wins = 0;
            rec.soros_stake = 0.0;
        }
        return;
    }

    rec.soros_wins = 0;
    rec.soros_stake = 0.0;
    rec.consecutive_losses++;
    rec.step = std::min(rec.step + 1, policy_.martingale_max_steps);

    if (rec.consecutive_losses >= policy_.stop_loss_consecutive) {
        rec.cooldown_until_ms = now_ms_() +
            static_cast<int64_t>(policy_.loss_cooldown_minutes) * 60 * 1000;
        rec.consecutive_losses = 0;
        rec.step = 0;
        spdlog::info("[{}] {} losses in a row, cooling down for {}m", instrument,
                     policy_.stop_loss_consecutive, policy_.loss_cooldown_minutes);
    }
}

int RiskManager::martingale_step(const std::string& instrument) const {
    auto it = records_.find(instrument);
    return it == records_.end() ? 0 : it->second.step;
}

int RiskManager::soros_wins(const std::string& instrument) const {
    auto it = records_.find(instrument);
    return it == records_.end() ? 0 : it->second.soros_wins;
}
