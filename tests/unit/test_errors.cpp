#include "Errors.hpp"
#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace seriesio;

TEST_CASE("context is prepended and the kind survives", "[errors]")
{
    try
    {
        try
        {
            throw Error(ErrorKind::MissingVariable, "no `flux`");
        }
        catch (const std::exception&)
        {
            rethrow_with_context("While trying to read data from file `a.h5`");
        }
    }
    catch (const Error& e)
    {
        REQUIRE(e.kind() == ErrorKind::MissingVariable);
        REQUIRE(std::string(e.what()) ==
                "While trying to read data from file `a.h5`, the following error occurred: "
                "no `flux`");
    }
}

TEST_CASE("foreign exceptions become I/O errors", "[errors]")
{
    try
    {
        try
        {
            throw std::runtime_error("disk full");
        }
        catch (const std::exception&)
        {
            rethrow_with_context("ctx");
        }
    }
    catch (const Error& e)
    {
        REQUIRE(e.kind() == ErrorKind::Io);
        REQUIRE(std::string(to_string(e.kind())) == "Io");
    }
}
