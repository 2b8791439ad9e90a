#include "news_calendar.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>

CalendarNewsGate::CalendarNewsGate(std::shared_ptr<HttpClient> http,
                                   std::string endpoint,
                                   int buffer_minutes,
                                   int refresh_minutes,
                                   Clock now_ms)
    : http_(std::move(http))
    , endpoint_(std::move(endpoint))
    , buffer_minutes_(buffer_minutes)
    , refresh_minutes_(refresh_minutes)
    , now_ms_(std::move(now_ms))
{}

bool CalendarNewsGate::has_imminent_high_impact_event() {
    int64_t now = now_ms_();
    refresh_if_stale(now);
    return has_high_impact_within(events_, now, buffer_minutes_);
}

void CalendarNewsGate::refresh_if_stale(int64_t now_ms) {
    int64_t refresh_ms = static_cast<int64_t>(refresh_minutes_) * 60 * 1000;
    if (last_refresh_ms_ != 0 && now_ms - last_refresh_ms_ < refresh_ms) {
        return;
    }

    try {
        events_ = parse_events(http_->get_json(endpoint_));
        last_refresh_ms_ = now_ms;
        spdlog::debug("News calendar refreshed: {} events", events_.size());
    } catch (const std::exception& e) {
        // Keep whatever calendar we had; retry on the next check
        spdlog::warn("News calendar refresh failed: {}", e.what());
    }
}

std::vector<NewsEvent> CalendarNewsGate::parse_events(const nlohmann::json& body) {
    std::vector<NewsEvent> events;
    if (!body.is_array()) {
        throw std::runtime_error("calendar payload is not an array");
    }

    for (const auto& raw : body) {
        if (!raw.is_object() || !raw.contains("date") || !raw["date"].is_string()) {
            continue;
        }

        NewsEvent ev;
        if (!util::parse_iso8601_ms(raw["date"].get<std::string>(), ev.ts_ms)) {
            spdlog::debug("Skipping calendar entry with bad date: {}", raw["date"].dump());
            continue;
        }
        ev.title = raw.value("title", "");
        ev.country = raw.value("country", "");
        ev.impact = raw.value("impact", "");
        events.push_back(std::move(ev));
    }
    return events;
}

bool CalendarNewsGate::has_high_impact_within(const std::vector<NewsEvent>& events,
                                              int64_t now_ms, int buffer_minutes) {
    int64_t buffer_ms = static_cast<int64_t>(buffer_minutes) * 60 * 1000;
    for (const auto& ev : events) {
        if (util::to_upper(ev.impact) != "HIGH") continue;
        if (std::llabs(ev.ts_ms - now_ms) <= buffer_ms) {
            spdlog::info("High-impact event within {}m: {} ({})", buffer_minutes, ev.title, ev.country);
            return true;
        }
    }
    return false;
}
