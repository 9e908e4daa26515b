#include "schemacast/value.hpp"

#include <cstdio>
#include <regex>

namespace schemacast
{

namespace
{

bool is_leap(int y)
{
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int y, unsigned m)
{
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y))
        return 29;
    return kDays[m - 1];
}

bool valid_date(int y, unsigned m, unsigned d)
{
    return m >= 1 && m <= 12 && d >= 1 && d <= days_in_month(y, m);
}

// Howard Hinnant's civil calendar conversions.
std::int64_t days_from_civil(int y, unsigned m, unsigned d)
{
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

Date civil_from_days(std::int64_t z)
{
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Date{static_cast<int>(y + (m <= 2)), m, d};
}

int to_int(const std::ssub_match& m)
{
    return std::stoi(m.str());
}

} // namespace

std::optional<Date> Date::parse(const std::string& text)
{
    static const std::regex date_re(R"(^(\d{4})-(\d{2})-(\d{2})$)");
    std::smatch match;
    if (!std::regex_match(text, match, date_re))
        return std::nullopt;

    Date d{to_int(match[1]), static_cast<unsigned>(to_int(match[2])),
           static_cast<unsigned>(to_int(match[3]))};
    if (!valid_date(d.year, d.month, d.day))
        return std::nullopt;
    return d;
}

std::string Date::to_iso8601() const
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
    return buf;
}

std::optional<DateTime> DateTime::parse(const std::string& text)
{
    // fractions are limited to what fits in 40 characters
    if (text.size() > 40)
        return std::nullopt;
    static const std::regex dt_re(
        R"(^(\d{4})-(\d{2})-(\d{2})[Tt ](\d{2}):(\d{2}):(\d{2})(?:\.(\d+))?(?:([Zz])|([+-])(\d{2}):(\d{2}))$)");
    std::smatch match;
    if (!std::regex_match(text, match, dt_re))
        return std::nullopt;

    const int year = to_int(match[1]);
    const auto month = static_cast<unsigned>(to_int(match[2]));
    const auto day = static_cast<unsigned>(to_int(match[3]));
    const int hour = to_int(match[4]);
    const int minute = to_int(match[5]);
    const int second = to_int(match[6]);
    if (!valid_date(year, month, day) || hour > 23 || minute > 59 || second > 59)
        return std::nullopt;

    std::uint32_t micros = 0;
    if (match[7].matched)
    {
        std::string frac = match[7].str().substr(0, 6);
        frac.resize(6, '0');
        micros = static_cast<std::uint32_t>(std::stoul(frac));
    }

    std::int64_t offset = 0;
    if (!match[8].matched)
    {
        const int off_h = to_int(match[10]);
        const int off_m = to_int(match[11]);
        if (off_h > 23 || off_m > 59)
            return std::nullopt;
        offset = off_h * 3600 + off_m * 60;
        if (match[9].str() == "-")
            offset = -offset;
    }

    DateTime dt;
    dt.seconds = days_from_civil(year, month, day) * 86400 + hour * 3600 + minute * 60 + second -
                 offset;
    dt.microsecond = micros;
    return dt;
}

std::string DateTime::to_iso8601() const
{
    std::int64_t days = seconds / 86400;
    std::int64_t rem = seconds % 86400;
    if (rem < 0)
    {
        rem += 86400;
        --days;
    }
    const Date date = civil_from_days(days);
    const int hour = static_cast<int>(rem / 3600);
    const int minute = static_cast<int>((rem % 3600) / 60);
    const int second = static_cast<int>(rem % 60);

    char buf[40];
    if (microsecond == 0)
        std::snprintf(buf, sizeof(buf), "%sT%02d:%02d:%02dZ", date.to_iso8601().c_str(), hour,
                      minute, second);
    else
        std::snprintf(buf, sizeof(buf), "%sT%02d:%02d:%02d.%06uZ", date.to_iso8601().c_str(),
                      hour, minute, second, static_cast<unsigned>(microsecond));
    return buf;
}

} // namespace schemacast
