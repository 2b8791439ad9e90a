#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();
    std::vector<std::string> split(const std::string& str, char delim);
    std::string to_upper(std::string str);
    std::string redact_secret(const std::string& secret);

    // Parses "YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM)" into epoch milliseconds.
    bool parse_iso8601_ms(const std::string& text, int64_t& out_ms);
}
