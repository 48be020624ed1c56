#include "time/Timegrid.hpp"
#include "Errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace seriesio::time
{

namespace
{

std::string trim(std::string_view s)
{
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char) s[b]))
        ++b;
    while (e > b && std::isspace((unsigned char) s[e - 1]))
        --e;
    return std::string(s.substr(b, e - b));
}

std::string lower(std::string s)
{
    for (auto& c : s)
        c = (char) std::tolower((unsigned char) c);
    return s;
}

[[noreturn]] void bad_date(std::string_view text)
{
    throw Error(ErrorKind::InvalidArgument,
                "Cannot interpret `" + std::string(text) +
                    "` as a date (expected `YYYY-MM-DD hh:mm:ss`, optionally with a UTC offset).");
}

} // namespace

TimePoint parse_date(std::string_view text)
{
    const std::string s = trim(text);
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0, n = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &y, &mo, &d, &n) != 3)
        bad_date(text);
    std::size_t pos = std::size_t(n);

    // time of day
    if (pos + 1 < s.size() && (s[pos] == ' ' || s[pos] == 'T') &&
        std::isdigit((unsigned char) s[pos + 1]))
    {
        int m = 0;
        if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d%n", &h, &mi, &m) != 2)
            bad_date(text);
        pos += 1 + std::size_t(m);
        if (pos < s.size() && s[pos] == ':')
        {
            if (std::sscanf(s.c_str() + pos + 1, "%2d%n", &sec, &m) != 1)
                bad_date(text);
            pos += 1 + std::size_t(m);
        }
    }

    // UTC offset
    int offset_min = 0;
    while (pos < s.size() && s[pos] == ' ')
        ++pos;
    if (pos < s.size())
    {
        if (s[pos] == 'Z')
        {
            ++pos;
        }
        else if (s[pos] == '+' || s[pos] == '-')
        {
            const int sign = (s[pos] == '-') ? -1 : 1;
            int oh = 0, om = 0, m = 0;
            if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d%n", &oh, &om, &m) != 2)
                bad_date(text);
            offset_min = sign * (oh * 60 + om);
            pos += 1 + std::size_t(m);
        }
    }
    if (pos != s.size())
        bad_date(text);

    const std::chrono::year_month_day ymd{std::chrono::year{y},
                                          std::chrono::month{unsigned(mo)},
                                          std::chrono::day{unsigned(d)}};
    if (!ymd.ok() || h < 0 || h > 23 || mi < 0 || mi > 59 || sec < 0 || sec > 59)
        bad_date(text);

    return TimePoint{std::chrono::sys_days{ymd}} + std::chrono::hours{h} +
           std::chrono::minutes{mi} + Seconds{sec} - std::chrono::minutes{offset_min};
}

std::string format_date(TimePoint t)
{
    const auto days = std::chrono::floor<std::chrono::days>(t);
    const std::chrono::year_month_day ymd{days};
    const std::chrono::hh_mm_ss hms{t - days};
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02d:%02d:%02d", int(ymd.year()),
                  unsigned(ymd.month()), unsigned(ymd.day()), int(hms.hours().count()),
                  int(hms.minutes().count()), int(hms.seconds().count()));
    return buf;
}

Seconds unit_seconds(std::string_view unit)
{
    const auto u = lower(trim(unit));
    if (u == "seconds" || u == "second")
        return Seconds{1};
    if (u == "minutes" || u == "minute")
        return Seconds{60};
    if (u == "hours" || u == "hour")
        return Seconds{3600};
    if (u == "days" || u == "day")
        return Seconds{86400};
    throw Error(ErrorKind::InvalidArgument, "Unknown time unit `" + std::string(unit) +
                                                "` (use seconds, minutes, hours, or days).");
}

Seconds parse_stepsize(std::string_view text)
{
    const auto s = lower(trim(text));
    if (s.empty())
        throw Error(ErrorKind::InvalidArgument, "Empty step size.");
    std::size_t used = 0;
    long long value = 0;
    try
    {
        value = std::stoll(s, &used);
    }
    catch (const std::exception&)
    {
        throw Error(ErrorKind::InvalidArgument, "Cannot interpret `" + s + "` as a step size.");
    }
    const std::string suffix = trim(std::string_view(s).substr(used));
    long long factor = 0;
    if (suffix.empty() || suffix == "s")
        factor = 1;
    else if (suffix == "m")
        factor = 60;
    else if (suffix == "h")
        factor = 3600;
    else if (suffix == "d")
        factor = 86400;
    if (factor == 0 || value <= 0)
        throw Error(ErrorKind::InvalidArgument, "Cannot interpret `" + s + "` as a step size.");
    return Seconds{value * factor};
}

std::string to_cfunits(TimePoint refdate, std::string_view unit)
{
    (void) unit_seconds(unit); // validate
    return std::string(unit) + " since " + format_date(refdate);
}

CfUnits parse_cfunits(std::string_view text)
{
    const std::string s = trim(text);
    std::istringstream in(s);
    std::string unit, since;
    in >> unit >> since;
    if (unit.empty() || lower(since) != "since")
        throw Error(ErrorKind::InvalidArgument,
                    "Cannot interpret `" + s + "` as a unit string like `hours since <date>`.");
    std::string rest;
    std::getline(in, rest);
    (void) unit_seconds(unit);
    return CfUnits{unit, parse_date(rest)};
}

Timegrid::Timegrid(TimePoint first, TimePoint last, Seconds step)
    : first_(first), last_(last), step_(step)
{
    if (step_.count() <= 0)
        throw Error(ErrorKind::InvalidArgument, "Timegrid step size must be positive.");
    if (last_ <= first_)
        throw Error(ErrorKind::InvalidArgument,
                    "Timegrid end " + format_date(last_) + " must lie after its start " +
                        format_date(first_) + ".");
    if ((last_ - first_) % step_ != Seconds{0})
        throw Error(ErrorKind::InvalidArgument,
                    "Timegrid span " + format_date(first_) + " - " + format_date(last_) +
                        " is not a multiple of the step size " + std::to_string(step_.count()) +
                        "s.");
}

std::vector<double> Timegrid::to_timepoints(std::string_view unit) const
{
    const double u = double(unit_seconds(unit).count());
    std::vector<double> out(size());
    for (std::size_t i = 0; i < out.size(); ++i)
        out[i] = double((step_ * std::int64_t(i)).count()) / u;
    return out;
}

Timegrid Timegrid::from_timepoints(std::span<const double> points, TimePoint refdate,
                                   std::string_view unit)
{
    if (points.size() < 2)
        throw Error(ErrorKind::InvalidArgument,
                    "At least two time points are required to reconstruct a time window, got " +
                        std::to_string(points.size()) + ".");
    const double u = double(unit_seconds(unit).count());
    auto offset = [&](double p) { return Seconds{std::llround(p * u)}; };

    const Seconds step = offset(points[1]) - offset(points[0]);
    for (std::size_t i = 2; i < points.size(); ++i)
        if (offset(points[i]) - offset(points[i - 1]) != step)
            throw Error(ErrorKind::InvalidArgument,
                        "Time points are not equally spaced (position " + std::to_string(i) +
                            ").");
    const TimePoint first = refdate + offset(points.front());
    const TimePoint last = refdate + offset(points.back()) + step;
    return Timegrid(first, last, step);
}

std::string Timegrid::to_string() const
{
    return "Timegrid(\"" + format_date(first_) + "\", \"" + format_date(last_) + "\", " +
           std::to_string(step_.count()) + "s)";
}

} // namespace seriesio::time
