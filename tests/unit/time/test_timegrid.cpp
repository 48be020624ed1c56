#include "Errors.hpp"
#include "time/Timegrid.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <vector>

using namespace seriesio;
using namespace seriesio::time;
using Catch::Approx;

TEST_CASE("dates parse with optional time of day and UTC offset", "[time]")
{
    const auto ref = parse_date("2000-01-01 00:00:00");
    REQUIRE(format_date(ref) == "2000-01-01 00:00:00");
    REQUIRE(parse_date("2000-01-01") == ref);
    REQUIRE(parse_date("2000-01-01T00:00") == ref);
    REQUIRE(parse_date("2000-01-01 00:00:00Z") == ref);
    REQUIRE(parse_date("2000-01-01 01:00:00+01:00") == ref);
    REQUIRE(format_date(parse_date("1999-12-31 22:30:00 -01:30")) == "2000-01-01 00:00:00");

    REQUIRE_THROWS_AS(parse_date("2000-13-01"), Error);
    REQUIRE_THROWS_AS(parse_date("2000-02-30 00:00:00"), Error);
    REQUIRE_THROWS_AS(parse_date("yesterday"), Error);
    REQUIRE_THROWS_AS(parse_date("2000-01-01 25:00:00"), Error);
}

TEST_CASE("units and step sizes", "[time]")
{
    REQUIRE(unit_seconds("hours") == Seconds{3600});
    REQUIRE(unit_seconds("Day") == Seconds{86400});
    REQUIRE_THROWS_AS(unit_seconds("weeks"), Error);

    REQUIRE(parse_stepsize("1d") == Seconds{86400});
    REQUIRE(parse_stepsize("6h") == Seconds{21600});
    REQUIRE(parse_stepsize("30m") == Seconds{1800});
    REQUIRE(parse_stepsize("15s") == Seconds{15});
    REQUIRE_THROWS_AS(parse_stepsize("0h"), Error);
    REQUIRE_THROWS_AS(parse_stepsize("3y"), Error);
}

TEST_CASE("reference unit strings round trip", "[time]")
{
    const auto ref = parse_date("2000-01-01 06:00:00");
    const auto text = to_cfunits(ref, "hours");
    REQUIRE(text == "hours since 2000-01-01 06:00:00");

    const auto cf = parse_cfunits(text);
    REQUIRE(cf.unit == "hours");
    REQUIRE(cf.refdate == ref);

    REQUIRE(parse_cfunits("days since 2000-01-01 00:00:00 +01:00").refdate ==
            parse_date("1999-12-31 23:00:00"));
    REQUIRE_THROWS_AS(parse_cfunits("hours after 2000-01-01"), Error);
    REQUIRE_THROWS_AS(parse_cfunits("fortnights since 2000-01-01"), Error);
}

TEST_CASE("Timegrid validates its bounds", "[time]")
{
    const auto a = parse_date("2000-01-01");
    const auto b = parse_date("2000-01-05");
    REQUIRE(Timegrid(a, b, std::chrono::hours{24}).size() == 4);

    REQUIRE_THROWS_AS(Timegrid(a, b, Seconds{0}), Error);
    REQUIRE_THROWS_AS(Timegrid(b, a, std::chrono::hours{24}), Error);
    REQUIRE_THROWS_AS(Timegrid(a, b, std::chrono::hours{7}), Error);
}

TEST_CASE("Timegrid converts to and from time points", "[time]")
{
    const Timegrid grid(parse_date("2000-01-01"), parse_date("2000-01-05"), std::chrono::hours{24});

    const auto hours = grid.to_timepoints("hours");
    REQUIRE(hours.size() == 4);
    CHECK(hours[0] == Approx(0.0));
    CHECK(hours[3] == Approx(72.0));

    const auto days = grid.to_timepoints("days");
    CHECK(days[1] == Approx(1.0));

    REQUIRE(Timegrid::from_timepoints(hours, grid.first(), "hours") == grid);
    REQUIRE(Timegrid::from_timepoints(days, grid.first(), "days") == grid);

    // offsets relative to an earlier reference date
    const std::vector<double> shifted{24.0, 48.0};
    const auto sub = Timegrid::from_timepoints(shifted, parse_date("1999-12-31"), "hours");
    REQUIRE(sub.first() == grid.first());
    REQUIRE(sub.size() == 2);

    const std::vector<double> one{0.0};
    REQUIRE_THROWS_AS(Timegrid::from_timepoints(one, grid.first(), "hours"), Error);
    const std::vector<double> uneven{0.0, 1.0, 3.0};
    REQUIRE_THROWS_AS(Timegrid::from_timepoints(uneven, grid.first(), "hours"), Error);
}

TEST_CASE("Timegrid prints its bounds", "[time]")
{
    const Timegrid grid(parse_date("2000-01-01"), parse_date("2000-01-02"), std::chrono::hours{6});
    REQUIRE(grid.to_string() ==
            "Timegrid(\"2000-01-01 00:00:00\", \"2000-01-02 00:00:00\", 21600s)");
    REQUIRE(grid.at(1) == parse_date("2000-01-01 06:00"));
}
