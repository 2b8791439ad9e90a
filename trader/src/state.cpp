#include "state.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <tuple>

bool CalendarDate::operator<(const CalendarDate& other) const {
    return std::tie(year, month, day) < std::tie(other.year, other.month, other.day);
}

bool CalendarDate::operator==(const CalendarDate& other) const {
    return year == other.year && month == other.month && day == other.day;
}

std::string CalendarDate::to_string() const {
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << year << '-'
       << std::setw(2) << month << '-' << std::setw(2) << day;
    return ss.str();
}

CalendarDate local_today() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&itt, &local);
    return CalendarDate{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
}

bool SessionState::roll_date(const CalendarDate& today) {
    bool reset = false;
    if (!last_trade_date || *last_trade_date < today) {
        daily_wins = 0;
        reset = true;
    }
    last_trade_date = today;
    return reset;
}
