#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        // Trim whitespace
        token.erase(0, token.find_first_not_of(" \t\n\r"));
        token.erase(token.find_last_not_of(" \t\n\r") + 1);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::string to_upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

std::string redact_secret(const std::string& secret) {
    if (secret.empty()) return "";
    return "***";
}

bool parse_iso8601_ms(const std::string& text, int64_t& out_ms) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return false;

    int64_t millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string frac;
        while (std::isdigit(ss.peek())) {
            frac.push_back(static_cast<char>(ss.get()));
        }
        frac = (frac + "000").substr(0, 3);
        millis = std::stoll(frac);
    }

    int64_t offset_s = 0;
    int sign = ss.peek();
    if (sign == 'Z') {
        ss.get();
    } else if (sign == '+' || sign == '-') {
        ss.get();
        int hh = 0, mm = 0;
        char colon = 0;
        ss >> hh >> colon >> mm;
        if (ss.fail() || colon != ':') return false;
        offset_s = (hh * 3600 + mm * 60) * (sign == '+' ? 1 : -1);
    }
    // No designator means UTC

    int64_t epoch_s = static_cast<int64_t>(timegm(&tm));
    out_ms = (epoch_s - offset_s) * 1000 + millis;
    return true;
}

} // namespace util
