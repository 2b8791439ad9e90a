#pragma once

#include "collaborators.hpp"
#include "http_client.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct NewsEvent {
    std::string title;
    std::string country;
    std::string impact;
    int64_t ts_ms;
};

// Economic calendar feed. Pauses trading within buffer minutes of a
// high-impact release. Fails open when the feed is unreachable.
class CalendarNewsGate : public NewsGate {
public:
    using Clock = std::function<int64_t()>;

    CalendarNewsGate(std::shared_ptr<HttpClient> http,
                     std::string endpoint,
                     int buffer_minutes,
                     int refresh_minutes,
                     Clock now_ms);

    bool has_imminent_high_impact_event() override;

    static std::vector<NewsEvent> parse_events(const nlohmann::json& body);
    static bool has_high_impact_within(const std::vector<NewsEvent>& events,
                                       int64_t now_ms, int buffer_minutes);

private:
    std::shared_ptr<HttpClient> http_;
    std::string endpoint_;
    int buffer_minutes_;
    int refresh_minutes_;
    Clock now_ms_;

    std::vector<NewsEvent> events_;
    int64_t last_refresh_ms_ = 0;

    void refresh_if_stale(int64_t now_ms);
};

// Used when no calendar is configured
class DisabledNewsGate : public NewsGate {
public:
    bool has_imminent_high_impact_event() override { return false; }
};
