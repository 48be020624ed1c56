#include "Errors.hpp"
#include "io/ArrayFile.hpp"
#include "io/CharMatrix.hpp"
#include "io/Variable.hpp"
#include "io_fixtures.hpp"
#include "series/Series.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <string>
#include <vector>

using namespace seriesio;
using namespace seriesio::io;
using seriesio::series::aggregate;
using seriesio::series::SeriesHandle;
using Catch::Approx;

namespace
{

// A: rank 0; B: rank 1 with extent 2; both over four days.
struct TwoDevices
{
    SeriesHandle a{"A", "temp", "model", false, {}, four_days()};
    SeriesHandle b{"B", "temp", "model", false, {2}, four_days()};

    TwoDevices()
    {
        a.set_series({1, 2, 3, 4});
        b.set_series({10, 11, 20, 21, 30, 31, 40, 41});
    }
};

ArrayFile open_with_time(const std::string& path)
{
    ArrayFile f(path, ArrayFile::Mode::Write);
    f.create_dimension("time", 4);
    return f;
}

} // namespace

TEST_CASE("Deep variables pad smaller devices with the fill value", "[io][variable]")
{
    TwoDevices d;
    Variable v("temp", Variable::Kind::Deep, false, NameMapping{});
    v.log(d.a);
    v.log(d.b);

    REQUIRE(v.prefix() == "temp_");
    REQUIRE(v.subdevicenames() == std::vector<std::string>{"A", "B"});
    REQUIRE(v.dimensions() == std::vector<std::string>{"temp_stations", "time", "temp_axis3"});
    REQUIRE(v.shape() == std::vector<std::size_t>{2, 4, 2});

    const auto arr = v.array();
    REQUIRE(arr.size() == 16);
    CHECK(arr[0] == Approx(1.0));    // A, t0, 0
    CHECK(arr[1] == Approx(-999.0)); // A, t0, 1
    CHECK(arr[8] == Approx(10.0));   // B, t0, 0
    CHECK(arr[15] == Approx(41.0));  // B, t3, 1
}

TEST_CASE("Deep variables round trip through a file", "[io][variable]")
{
    TempDir dir("seriesio_variable_deep");
    const auto path = dir.file("model.h5");
    {
        TwoDevices d;
        Variable v("temp", Variable::Kind::Deep, false, NameMapping{});
        v.log(d.a);
        v.log(d.b);
        ArrayFile f = open_with_time(path);
        v.write(f);
        f.close();
    }

    ArrayFile f(path, ArrayFile::Mode::Read);
    REQUIRE(f.variable_shape("temp") == std::vector<std::size_t>{2, 4, 2});
    const auto raw = f.read_doubles("temp");
    CHECK(raw[1] == Approx(-999.0)); // beyond A's extent
    CHECK(raw[7] == Approx(-999.0));

    SeriesHandle a("A", "temp", "model", false, {}, four_days());
    SeriesHandle b("B", "temp", "model", false, {2}, four_days());
    Variable v("temp", Variable::Kind::Deep, false, NameMapping{});
    v.log(b); // order differs from the file
    v.log(a);
    v.read(f, four_days());
    REQUIRE(a.series().size() == 4);
    CHECK(a.series()[3] == Approx(4.0));
    CHECK(b.series()[0] == Approx(10.0));
    CHECK(b.series()[7] == Approx(41.0));
}

TEST_CASE("Flat variables get one row per cell", "[io][variable]")
{
    TwoDevices d;
    Variable v("temp", Variable::Kind::Flat, false, NameMapping{});
    v.log(d.a);
    v.log(d.b);

    REQUIRE(v.subdevicenames() == std::vector<std::string>{"A", "B_0", "B_1"});
    REQUIRE(v.dimensions() == std::vector<std::string>{"temp_stations", "time"});
    REQUIRE(v.shape() == std::vector<std::size_t>{3, 4});

    const auto arr = v.array();
    CHECK(arr[0] == Approx(1.0));   // A, t0
    CHECK(arr[4] == Approx(10.0));  // B_0, t0
    CHECK(arr[5] == Approx(20.0));  // B_0, t1
    CHECK(arr[8] == Approx(11.0));  // B_1, t0
    CHECK(arr[11] == Approx(41.0)); // B_1, t3
}

TEST_CASE("Flat row labels enumerate higher ranks in row-major order", "[io][variable]")
{
    SeriesHandle c("C", "states", "model", false, {2, 2}, four_days());
    Variable v("states", Variable::Kind::Flat, true, NameMapping{});
    v.log(c);
    REQUIRE(v.prefix().empty());
    REQUIRE(v.subdevicenames() == std::vector<std::string>{"C_0_0", "C_0_1", "C_1_0", "C_1_1"});
    REQUIRE(v.shape() == std::vector<std::size_t>{4, 4});
}

TEST_CASE("Flat variables round trip through a file", "[io][variable]")
{
    TempDir dir("seriesio_variable_flat");
    const auto path = dir.file("model.h5");
    {
        TwoDevices d;
        Variable v("temp", Variable::Kind::Flat, true, NameMapping{});
        v.log(d.a);
        v.log(d.b);
        ArrayFile f = open_with_time(path);
        v.write(f);
    }

    ArrayFile f(path, ArrayFile::Mode::Read);
    REQUIRE(f.has_variable("station_names"));
    SeriesHandle a("A", "temp", "model", false, {}, four_days());
    SeriesHandle b("B", "temp", "model", false, {2}, four_days());
    Variable v("temp", Variable::Kind::Flat, true, NameMapping{});
    v.log(a);
    v.log(b);
    v.read(f, four_days());
    CHECK(a.series()[1] == Approx(2.0));
    CHECK(b.series()[2] == Approx(20.0));
    CHECK(b.series()[5] == Approx(31.0));
}

TEST_CASE("Agg variables store one value per device and time point", "[io][variable]")
{
    TwoDevices d;
    Variable v("temp_mean", Variable::Kind::Agg, false, NameMapping{});
    v.log(d.a, aggregate(d.a, "mean"));
    v.log(d.b, aggregate(d.b, "mean"));

    REQUIRE(v.dimensions() == std::vector<std::string>{"temp_mean_stations", "time"});
    REQUIRE(v.shape() == std::vector<std::size_t>{2, 4});
    const auto arr = v.array();
    CHECK(arr[0] == Approx(1.0));
    CHECK(arr[4] == Approx(10.5));
    CHECK(arr[7] == Approx(40.5));

    TempDir dir("seriesio_variable_agg");
    const auto path = dir.file("model.h5");
    {
        ArrayFile f = open_with_time(path);
        v.write(f);
    }
    ArrayFile f(path, ArrayFile::Mode::Read);
    try
    {
        v.read(f, four_days());
        FAIL("aggregated data must not be readable");
    }
    catch (const Error& e)
    {
        REQUIRE(e.kind() == ErrorKind::NotInvertible);
        REQUIRE(std::string(e.what()).find("`temp_mean`") != std::string::npos);
    }
}

TEST_CASE("later logs replace earlier ones", "[io][variable]")
{
    TwoDevices d;
    SeriesHandle a2("A", "temp", "model", false, {}, four_days());
    Variable v("temp", Variable::Kind::Deep, false, NameMapping{});
    v.log(d.a);
    v.log(a2);
    REQUIRE(v.devicenames() == std::vector<std::string>{"A"});
    REQUIRE(v.entry("A").handle == &a2);
    REQUIRE(v.find("B") == nullptr);

    try
    {
        (void) v.entry("B");
        FAIL("expected an unknown device");
    }
    catch (const Error& e)
    {
        REQUIRE(e.kind() == ErrorKind::NotRegistered);
    }
}

TEST_CASE("logged arrays must fit the variable", "[io][variable]")
{
    TwoDevices d;

    Variable agg("temp_mean", Variable::Kind::Agg, false, NameMapping{});
    REQUIRE_THROWS_AS(agg.log(d.b), Error); // no aggregated array for a rank-1 series

    Variable deep("temp", Variable::Kind::Deep, false, NameMapping{});
    series::LoggedArray odd;
    odd.values = {1.0, 2.0, 3.0};
    try
    {
        deep.log(d.b, odd);
        FAIL("expected a shape mismatch");
    }
    catch (const Error& e)
    {
        REQUIRE(e.kind() == ErrorKind::InvalidArgument);
    }
    REQUIRE(deep.devicenames().empty());
}

TEST_CASE("coordinate lookup tries the prefixed name first", "[io][variable]")
{
    TempDir dir("seriesio_variable_coords");
    const auto path = dir.file("model.h5");
    {
        ArrayFile f(path, ArrayFile::Mode::Write);
        f.create_dimension("time", 4);
    }
    {
        ArrayFile f(path, ArrayFile::Mode::Read);
        Variable v("flux_prec", Variable::Kind::Deep, false, NameMapping{});
        try
        {
            (void) v.query_subdevicenames(f);
            FAIL("expected a missing coordinate");
        }
        catch (const Error& e)
        {
            REQUIRE(e.kind() == ErrorKind::MissingCoordinate);
            const std::string msg = e.what();
            CAPTURE(msg);
            REQUIRE(msg.find("`flux_prec_station_names` nor `station_names`") !=
                    std::string::npos);
        }
    }

    // an isolated variable writes the bare name; a shared one still finds it
    {
        SeriesHandle e1("element1", "flux_prec", "model", false, {}, four_days());
        SeriesHandle e2("element_2", "flux_prec", "model", false, {}, four_days());
        Variable v("flux_prec", Variable::Kind::Deep, true, NameMapping{});
        v.log(e1);
        v.log(e2);
        ArrayFile f = open_with_time(path);
        v.insert_subdevicenames(f);
    }
    ArrayFile f(path, ArrayFile::Mode::Read);
    const std::vector<std::string> expected{"element1", "element_2"};
    REQUIRE(Variable("flux_prec", Variable::Kind::Deep, false, NameMapping{})
                .query_subdevicenames(f) == expected);
    REQUIRE(Variable("flux_prec", Variable::Kind::Deep, true, NameMapping{})
                .query_subdevicenames(f) == expected);

    const auto index =
        Variable("flux_prec", Variable::Kind::Deep, true, NameMapping{}).query_subdevice2index(f);
    REQUIRE(index.size() == 2);
    REQUIRE(index.get("element_2") == 1);
    REQUIRE_FALSE(index.contains("element5"));
    try
    {
        (void) index.get("element5");
        FAIL("expected missing device data");
    }
    catch (const Error& e)
    {
        REQUIRE(e.kind() == ErrorKind::MissingDeviceData);
        const std::string msg = e.what();
        CAPTURE(msg);
        REQUIRE(msg.find("`flux_prec`") != std::string::npos);
        REQUIRE(msg.find("`element5`") != std::string::npos);
        REQUIRE(msg.find(path) != std::string::npos);
    }
}

TEST_CASE("duplicate row labels report the first duplicate in file order", "[io][variable]")
{
    TempDir dir("seriesio_variable_dups");
    const auto path = dir.file("model.h5");
    {
        ArrayFile f(path, ArrayFile::Mode::Write);
        const CharMatrix m = str2chars({"element3", "element1", "element1_1", "element1",
                                        "element3"});
        f.create_dimension("stations", m.rows);
        f.create_dimension("char_leng_name", m.width);
        f.create_variable("station_names", DType::Char, {"stations", "char_leng_name"}, 0.0);
        f.write_chars("station_names", m.data);
    }
    ArrayFile f(path, ArrayFile::Mode::Read);
    Variable v("flux_prec", Variable::Kind::Flat, true, NameMapping{});
    try
    {
        (void) v.query_subdevice2index(f);
        FAIL("expected a duplicate");
    }
    catch (const Error& e)
    {
        REQUIRE(e.kind() == ErrorKind::DuplicateSubdevice);
        const std::string msg = e.what();
        CAPTURE(msg);
        REQUIRE(msg.find("the first found duplicate is `element3`") != std::string::npos);
    }
}

TEST_CASE("reading a device missing from the file names it", "[io][variable]")
{
    TempDir dir("seriesio_variable_missing_device");
    const auto path = dir.file("model.h5");
    {
        TwoDevices d;
        Variable v("temp", Variable::Kind::Deep, false, NameMapping{});
        v.log(d.a);
        ArrayFile f = open_with_time(path);
        v.write(f);
    }
    ArrayFile f(path, ArrayFile::Mode::Read);
    SeriesHandle c("C", "temp", "model", false, {}, four_days());
    Variable v("temp", Variable::Kind::Deep, false, NameMapping{});
    v.log(c);
    try
    {
        v.read(f, four_days());
        FAIL("expected missing device data");
    }
    catch (const Error& e)
    {
        REQUIRE(e.kind() == ErrorKind::MissingDeviceData);
        REQUIRE(std::string(e.what()).find("`C`") != std::string::npos);
    }
}
