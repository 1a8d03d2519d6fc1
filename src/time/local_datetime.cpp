/// @file local_datetime.cpp
/// @brief Strict ISO-8601 civil timestamp parsing.

#include "time/local_datetime.hpp"

#include <fmt/format.h>

#include <cctype>
#include <charconv>

namespace meridian::time
{

namespace
{

// Parse exactly 'width' decimal digits at 'pos'
std::optional<i32> fixed_digits(std::string_view text, std::size_t pos, std::size_t width)
{
    if (pos + width > text.size())
    {
        return std::nullopt;
    }
    for (std::size_t i = pos; i < pos + width; ++i)
    {
        if (std::isdigit(static_cast<unsigned char>(text[i])) == 0)
        {
            return std::nullopt;
        }
    }

    i32 value = 0;
    const auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + width, value);
    if (ec != std::errc{})
    {
        return std::nullopt;
    }
    return value;
}

bool expect(std::string_view text, std::size_t pos, char c)
{
    return pos < text.size() && text[pos] == c;
}

} // anonymous namespace

absl::CivilSecond LocalDateTime::civil() const
{
    return absl::CivilSecond(year, month, day, hour, minute, second);
}

std::string LocalDateTime::to_string() const
{
    if (nanosecond == 0)
    {
        return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}",
                           year, month, day, hour, minute, second);
    }
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:09d}",
                       year, month, day, hour, minute, second, nanosecond);
}

LocalDateTime LocalDateTime::from_civil(absl::CivilSecond cs, i32 nanosecond)
{
    return LocalDateTime{
        .year       = static_cast<i32>(cs.year()),
        .month      = cs.month(),
        .day        = cs.day(),
        .hour       = cs.hour(),
        .minute     = cs.minute(),
        .second     = cs.second(),
        .nanosecond = nanosecond,
    };
}

// -----------------------------------------------------------------
// YYYY-MM-DD[(T| )HH:MM[:SS[.f]]]
// -----------------------------------------------------------------

std::optional<LocalDateTime> parse_local_datetime(std::string_view text, bool allow_date_only)
{
    const auto year  = fixed_digits(text, 0, 4);
    const auto month = fixed_digits(text, 5, 2);
    const auto day   = fixed_digits(text, 8, 2);
    if (!year || !month || !day || !expect(text, 4, '-') || !expect(text, 7, '-'))
    {
        return std::nullopt;
    }

    LocalDateTime result{
        .year   = *year,
        .month  = *month,
        .day    = *day,
        .hour   = 0,
        .minute = 0,
        .second = 0,
    };

    if (text.size() == 10)
    {
        if (!allow_date_only)
        {
            return std::nullopt;
        }
    }
    else
    {
        if (!expect(text, 10, 'T') && !expect(text, 10, ' '))
        {
            return std::nullopt;
        }

        const auto hour   = fixed_digits(text, 11, 2);
        const auto minute = fixed_digits(text, 14, 2);
        if (!hour || !minute || !expect(text, 13, ':'))
        {
            return std::nullopt;
        }
        result.hour = *hour;
        result.minute = *minute;

        std::size_t pos = 16;
        if (expect(text, pos, ':'))
        {
            const auto second = fixed_digits(text, pos + 1, 2);
            if (!second)
            {
                return std::nullopt;
            }
            result.second = *second;
            pos += 3;

            if (expect(text, pos, '.'))
            {
                ++pos;
                std::size_t digits = 0;
                i32 nanos = 0;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0)
                {
                    if (digits == 9)
                    {
                        return std::nullopt;
                    }
                    nanos = nanos * 10 + (text[pos] - '0');
                    ++digits;
                    ++pos;
                }
                if (digits == 0)
                {
                    return std::nullopt;
                }
                for (std::size_t i = digits; i < 9; ++i)
                {
                    nanos *= 10;
                }
                result.nanosecond = nanos;
            }
        }

        // Trailing 'Z' or '+hh:mm' would make this an instant, not a civil time
        if (pos != text.size())
        {
            return std::nullopt;
        }
    }

    if (result.year < 1 || result.month < 1 || result.month > 12 ||
        result.day < 1 || result.day > days_in_month(result.year, result.month) ||
        result.hour > 23 || result.minute > 59 || result.second > 59)
    {
        return std::nullopt;
    }

    return result;
}

bool is_leap_year(i32 year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

i32 days_in_month(i32 year, i32 month)
{
    constexpr i32 kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12)
    {
        return 0;
    }
    return (month == 2 && is_leap_year(year)) ? 29 : kDays[month - 1];
}

} // namespace meridian::time
