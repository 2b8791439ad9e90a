#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/indicators.hpp"

using Catch::Approx;

static CandleWindow make_window(const std::vector<double>& lows, const std::vector<double>& highs) {
    CandleWindow w;
    w.instrument = "EURUSD";
    for (size_t i = 0; i < lows.size(); i++) {
        double mid = (lows[i] + highs[i]) / 2.0;
        w.candles.push_back(Candle{static_cast<int64_t>(60 * i), mid, highs[i], lows[i], mid, 10.0});
    }
    return w;
}

TEST_CASE("Rolling mean", "[indicators]") {
    std::vector<double> values{1.0, 2.0, 3.0, 4.0, 5.0};

    SECTION("Unavailable until the window fills") {
        auto out = Indicators::rolling_mean(values, 3);
        REQUIRE(out.size() == 5);
        REQUIRE_FALSE(out[0].has_value());
        REQUIRE_FALSE(out[1].has_value());
        REQUIRE(*out[2] == Approx(2.0));
        REQUIRE(*out[3] == Approx(3.0));
        REQUIRE(*out[4] == Approx(4.0));
    }

    SECTION("Period longer than the series yields nothing") {
        auto out = Indicators::rolling_mean(values, 6);
        for (const auto& v : out) {
            REQUIRE_FALSE(v.has_value());
        }
        REQUIRE_FALSE(Indicators::last_rolling_mean(values, 6).has_value());
    }

    SECTION("Non-positive period yields nothing") {
        REQUIRE_FALSE(Indicators::last_rolling_mean(values, 0).has_value());
        REQUIRE_FALSE(Indicators::rolling_mean(values, -1)[4].has_value());
    }

    SECTION("Last value matches the full series") {
        REQUIRE(*Indicators::last_rolling_mean(values, 2) == Approx(4.5));
        REQUIRE(*Indicators::last_rolling_mean(values, 5) == Approx(3.0));
    }

    SECTION("Constant series averages to exactly the constant") {
        std::vector<double> flat(40, 1.1);
        REQUIRE(*Indicators::last_rolling_mean(flat, 7) == 1.1);
        REQUIRE(*Indicators::last_rolling_mean(flat, 33) == 1.1);
    }
}

TEST_CASE("Support and resistance lookback", "[indicators]") {
    auto w = make_window({5.0, 4.0, 6.0, 7.0}, {8.0, 9.0, 10.0, 8.5});

    SECTION("Uses only the last lookback candles") {
        auto sr = Indicators::support_resistance(w, 2);
        REQUIRE(sr.has_value());
        REQUIRE(sr->support == 6.0);
        REQUIRE(sr->resistance == 10.0);
    }

    SECTION("Unavailable when the window is too short") {
        REQUIRE_FALSE(Indicators::support_resistance(w, 50).has_value());
    }
}

TEST_CASE("Fibonacci retracement levels", "[indicators]") {
    auto w = make_window({100.0, 120.0}, {150.0, 200.0});
    auto levels = Indicators::fibonacci_levels(w);

    REQUIRE(levels.size() == 5);
    REQUIRE(levels["fib_23"] == Approx(100.0 + 100.0 * 0.236));
    REQUIRE(levels["fib_38"] == Approx(138.2));
    REQUIRE(levels["fib_50"] == Approx(150.0));
    REQUIRE(levels["fib_61"] == Approx(161.8));
    REQUIRE(levels["fib_78"] == Approx(178.6));

    REQUIRE(Indicators::fibonacci_levels(CandleWindow{}).empty());
}

TEST_CASE("Trendline anchors", "[indicators]") {
    auto w = make_window({5.0, 3.0, 3.0, 6.0}, {9.0, 12.0, 8.0, 12.0});
    auto lines = Indicators::draw_trendlines(w);

    REQUIRE(lines.has_value());
    // First occurrence wins on ties
    REQUIRE(lines->lta.index == 1);
    REQUIRE(lines->lta.price == 3.0);
    REQUIRE(lines->ltb.index == 1);
    REQUIRE(lines->ltb.price == 12.0);

    REQUIRE_FALSE(Indicators::draw_trendlines(CandleWindow{}).has_value());
}
