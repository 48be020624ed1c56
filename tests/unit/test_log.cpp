#include "Log.hpp"
#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace seriesio::logx;

TEST_CASE("log level names parse case-insensitively", "[log]")
{
    CHECK(parse_level("DEBUG") == Level::Debug);
    CHECK(parse_level("Warning") == Level::Warn);
    CHECK(parse_level("off") == Level::Quiet);
    CHECK_FALSE(parse_level("verbose").has_value());
    CHECK(std::string(level_name(Level::Warn)) == "warn");
}

TEST_CASE("messages below the current level are filtered", "[log]")
{
    const Level saved = level();

    set_level(Level::Warn);
    CHECK(enabled(Level::Error));
    CHECK(enabled(Level::Warn));
    CHECK_FALSE(enabled(Level::Info));

    init({Level::Debug});
    CHECK(enabled(Level::Debug));

    set_level(Level::Quiet);
    CHECK_FALSE(enabled(Level::Error));
    CHECK_FALSE(enabled(Level::Quiet));

    set_level(saved);
}
