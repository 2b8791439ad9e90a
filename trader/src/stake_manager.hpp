#pragma once

#include "collaborators.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <string>

enum class StakeStrategy {
    Martingale,
    Soros
};

std::string to_string(StakeStrategy strategy);
// Throws std::invalid_argument for anything but "martingale" or "soros"
StakeStrategy parse_stake_strategy(const std::string& name);

struct StakePolicy {
    StakeStrategy strategy = StakeStrategy::Martingale;
    double base_stake = 1.0;

    double martingale_factor = 2.0;
    int martingale_max_steps = 2;

    // Soros reinvests the previous stake plus its profit, soros_level times at most
    int soros_level = 2;
    // Martingale recovers poorly on thin payouts; size those with Soros instead
    bool use_soros_if_low_payout = false;
    double min_payout_for_soros = 0.80;

    int stop_loss_consecutive = 3;
    int loss_cooldown_minutes = 30;
};

// Per-instrument stake sizing with a cooldown after a losing streak
class RiskManager : public StakeManager {
public:
    using Clock = std::function<int64_t()>;

    RiskManager(StakePolicy policy, Clock now_ms);

    bool can_trade(const std::string& instrument) override;
    double next_stake(const std::string& instrument, bool high_chance, double payout) override;
    void register_outcome(const std::string& instrument, bool win) override;

    int martingale_step(const std::string& instrument) const;
    int soros_wins(const std::string& instrument) const;

private:
    struct InstrumentRecord {
        int step = 0;
        int consecutive_losses = 0;
        int64_t cooldown_until_ms = 0;

        int soros_wins = 0;
        double soros_stake = 0.0;

        // Sizing of the most recent next_stake call
        double last_stake = 0.0;
        double last_payout = 0.0;
        bool last_was_soros = false;
    };

    StakePolicy policy_;
    Clock now_ms_;
    std::map<std::string, InstrumentRecord> records_;

    bool sizes_with_soros(double payout) const;
};
