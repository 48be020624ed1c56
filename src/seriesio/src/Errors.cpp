#include "Errors.hpp"
#include <exception>

namespace seriesio
{

const char* to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::NameCollision:
        return "NameCollision";
    case ErrorKind::MissingVariable:
        return "MissingVariable";
    case ErrorKind::MissingDimension:
        return "MissingDimension";
    case ErrorKind::MissingCoordinate:
        return "MissingCoordinate";
    case ErrorKind::DuplicateSubdevice:
        return "DuplicateSubdevice";
    case ErrorKind::MissingDeviceData:
        return "MissingDeviceData";
    case ErrorKind::NotInvertible:
        return "NotInvertible";
    case ErrorKind::NoGlobalWindow:
        return "NoGlobalWindow";
    case ErrorKind::NotRegistered:
        return "NotRegistered";
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    case ErrorKind::Io:
        return "Io";
    }
    return "Unknown";
}

void rethrow_with_context(const std::string& context)
{
    try
    {
        throw;
    }
    catch (const Error& e)
    {
        throw Error(e.kind(), context + ", the following error occurred: " + e.what());
    }
    catch (const std::exception& e)
    {
        throw Error(ErrorKind::Io, context + ", the following error occurred: " + e.what());
    }
}

} // namespace seriesio
