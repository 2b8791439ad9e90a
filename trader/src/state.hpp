#pragma once

#include <optional>
#include <string>

struct CalendarDate {
    int year;
    int month;
    int day;

    bool operator<(const CalendarDate& other) const;
    bool operator==(const CalendarDate& other) const;
    std::string to_string() const; // YYYY-MM-DD
};

// Local calendar date of the host clock
CalendarDate local_today();

// Daily session bookkeeping. Lives in memory only; a restart starts over.
struct SessionState {
    int daily_wins = 0;
    std::optional<CalendarDate> last_trade_date;

    // Resets daily_wins when today is past last_trade_date, then records today.
    // Returns true when a reset happened.
    bool roll_date(const CalendarDate& today);

    void record_win() { daily_wins++; }
    bool cap_reached(int daily_win_cap) const { return daily_wins >= daily_win_cap; }
};
