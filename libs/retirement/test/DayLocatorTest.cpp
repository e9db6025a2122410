#include <catch2/catch_test_macros.hpp>
#include <boost/optional/optional_io.hpp>
#include "DayLocator.h"
#include "TestUtils.h"

using namespace mkc_retirement;
using boost::gregorian::date;

TEST_CASE("DayLocator: finds the first sample on or after a date", "[DayLocator]") {
    PriceSeries series = createPriceSeries({
        {"20000103", 100.0},
        {"20000104", 101.0},
        {"20000107", 102.0},
        {"20000110", 103.0}
    });

    SECTION("exact match") {
        auto idx = DayLocator::locate(date(2000, 1, 4), series);
        REQUIRE(idx);
        REQUIRE(*idx == 1);
    }
    SECTION("date between samples resolves to the next sample") {
        auto idx = DayLocator::locate(date(2000, 1, 5), series);
        REQUIRE(idx);
        REQUIRE(*idx == 2);
    }
    SECTION("date before the first sample") {
        auto idx = DayLocator::locate(date(1999, 12, 1), series);
        REQUIRE(idx);
        REQUIRE(*idx == 0);
    }
    SECTION("last sample") {
        auto idx = DayLocator::locate(date(2000, 1, 10), series);
        REQUIRE(idx);
        REQUIRE(*idx == 3);
    }
    SECTION("date after the last sample is not found") {
        REQUIRE_FALSE(DayLocator::locate(date(2000, 1, 11), series));
        REQUIRE_FALSE(DayLocator::locate(date(boost::gregorian::pos_infin), series));
    }
}

TEST_CASE("DayLocator: duplicate dates resolve to the lowest index", "[DayLocator]") {
    PriceSeries series = createPriceSeries({
        {"20000103", 100.0},
        {"20000104", 101.0},
        {"20000104", 102.0},
        {"20000104", 103.0},
        {"20000105", 104.0}
    });

    auto idx = DayLocator::locate(date(2000, 1, 4), series);
    REQUIRE(idx);
    REQUIRE(*idx == 1);
}

TEST_CASE("DayLocator: search is limited to samples from firstIndex on", "[DayLocator]") {
    PriceSeries series = createPriceSeries({
        {"20000103", 100.0},
        {"20000104", 101.0},
        {"20000104", 102.0},
        {"20000110", 103.0}
    });

    SECTION("earlier match is skipped") {
        auto idx = DayLocator::locate(date(2000, 1, 4), series, 2);
        REQUIRE(idx);
        REQUIRE(*idx == 2);
    }
    SECTION("date before the window resolves to the window start") {
        auto idx = DayLocator::locate(date(1990, 1, 1), series, 3);
        REQUIRE(idx);
        REQUIRE(*idx == 3);
    }
    SECTION("index past the end") {
        REQUIRE_FALSE(DayLocator::locate(date(2000, 1, 3), series, 4));
        REQUIRE_FALSE(DayLocator::locate(date(2000, 1, 3), series, 100));
    }
}

TEST_CASE("DayLocator: result is the smallest index with date on or after target", "[DayLocator]") {
    PriceSeries series = createSyntheticMonthlySeries(date(1990, 1, 1), 60);

    for (date target(1989, 12, 15); target <= date(1995, 2, 1); target += boost::gregorian::days(7))
    {
        auto idx = DayLocator::locate(target, series);
        if (target > series.getLastDate())
        {
            REQUIRE_FALSE(idx);
            continue;
        }

        REQUIRE(idx);
        REQUIRE(series.getEntry(*idx).getDate() >= target);
        if (*idx > 0)
            REQUIRE(series.getEntry(*idx - 1).getDate() < target);
    }
}

TEST_CASE("DayLocator: empty series", "[DayLocator]") {
    PriceSeries empty;
    REQUIRE_FALSE(DayLocator::locate(date(2000, 1, 3), empty));
}
