#pragma once
#include <stdexcept>
#include <string>

/**
 * @file Errors.hpp
 * @brief Exception type shared by all SeriesIO layers.
 *
 * @details
 * Every failure is reported as a :cpp:class:`seriesio::Error` carrying an :cpp:enum:`ErrorKind`
 * so callers (and tests) can tell configuration/data-shape problems apart without parsing the
 * message. Outer layers prepend context via :cpp:func:`rethrow_with_context` and keep the kind.
 */

namespace seriesio
{

enum class ErrorKind
{
    NameCollision,
    MissingVariable,
    MissingDimension,
    MissingCoordinate,
    DuplicateSubdevice,
    MissingDeviceData,
    NotInvertible,
    NoGlobalWindow,
    NotRegistered,
    InvalidArgument,
    Io
};

const char* to_string(ErrorKind kind) noexcept;

class Error : public std::runtime_error
{
  public:
    Error(ErrorKind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

  private:
    ErrorKind kind_;
};

/// Must be called from inside a catch block. Re-raises the in-flight exception as an `Error`
/// whose message reads "<context>, the following error occurred: <message>".
/// `Error`s keep their kind; any other `std::exception` becomes `ErrorKind::Io`.
[[noreturn]] void rethrow_with_context(const std::string& context);

} // namespace seriesio
