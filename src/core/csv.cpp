/// @file csv.cpp
/// @brief Implementation of the strict CSV reader.

#include "core/csv.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>

namespace meridian::core
{

namespace
{

bool iequals(std::string_view a, std::string_view b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // anonymous namespace

// -----------------------------------------------------------------
// Read a whole dataset file
// -----------------------------------------------------------------

std::optional<CsvDocument> Csv::read_file(const std::filesystem::path& path,
                                          const std::vector<std::string_view>& expected_header,
                                          std::string_view what)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        MRD_CORE_ERROR("{}: Failed to open file: {}", what, path.string());
        return std::nullopt;
    }

    CsvDocument doc;
    {
        std::ostringstream buffer;
        buffer << file.rdbuf();
        doc.content = buffer.str();
    }

    std::istringstream stream(doc.content);
    std::string line;
    u32 line_number = 0;
    bool have_header = false;

    while (std::getline(stream, line))
    {
        ++line_number;

        const std::string_view trimmed = trim(line);
        if (trimmed.empty() || trimmed.front() == '#')
        {
            continue;
        }

        auto fields = split(trimmed);
        if (!fields)
        {
            MRD_CORE_ERROR("{}: Unterminated quoted field on line {} of {}",
                           what, line_number, path.string());
            return std::nullopt;
        }

        if (!have_header)
        {
            if (fields->size() != expected_header.size() ||
                !std::equal(fields->begin(), fields->end(), expected_header.begin(),
                            [](const std::string& got, std::string_view want) {
                                return iequals(trim(got), want);
                            }))
            {
                MRD_CORE_ERROR("{}: Unexpected header on line {} of {}: {}",
                               what, line_number, path.string(), trimmed);
                return std::nullopt;
            }
            doc.header = std::move(*fields);
            have_header = true;
            continue;
        }

        if (fields->size() != expected_header.size())
        {
            MRD_CORE_ERROR("{}: Line {} of {} has {} columns, expected {}: {}",
                           what, line_number, path.string(), fields->size(),
                           expected_header.size(), trimmed);
            return std::nullopt;
        }

        doc.rows.push_back(CsvRow{
            .line_number = line_number,
            .fields      = std::move(*fields),
        });
    }

    if (!have_header)
    {
        MRD_CORE_ERROR("{}: File is empty: {}", what, path.string());
        return std::nullopt;
    }

    return doc;
}

// -----------------------------------------------------------------
// Split one line, honouring double quotes
// -----------------------------------------------------------------

std::optional<std::vector<std::string>> Csv::split(std::string_view line)
{
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i)
    {
        const char c = line[i];

        if (in_quotes)
        {
            if (c == '"')
            {
                if (i + 1 < line.size() && line[i + 1] == '"')
                {
                    current.push_back('"');
                    ++i;
                }
                else
                {
                    in_quotes = false;
                }
            }
            else
            {
                current.push_back(c);
            }
            continue;
        }

        if (c == '"')
        {
            in_quotes = true;
        }
        else if (c == ',')
        {
            fields.emplace_back(trim(current));
            current.clear();
        }
        else
        {
            current.push_back(c);
        }
    }

    if (in_quotes)
    {
        return std::nullopt;
    }

    fields.emplace_back(trim(current));
    return fields;
}

std::string Csv::quote(std::string_view value)
{
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (const char c : value)
    {
        if (c == '"')
        {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view Csv::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse f64 from string_view
// -----------------------------------------------------------------

std::optional<f64> Csv::parse_f64(std::string_view sv)
{
    sv = trim(sv);
    if (sv.empty())
    {
        return std::nullopt;
    }

    // from_chars does not accept a leading '+'
    if (sv.front() == '+')
    {
        sv.remove_prefix(1);
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(value))
    {
        return std::nullopt;
    }

    return value;
}

// -----------------------------------------------------------------
// Utility: parse i64 from string_view
// -----------------------------------------------------------------

std::optional<i64> Csv::parse_i64(std::string_view sv)
{
    sv = trim(sv);
    if (sv.empty())
    {
        return std::nullopt;
    }

    if (sv.front() == '+')
    {
        sv.remove_prefix(1);
    }

    i64 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

u64 fnv1a_64(std::string_view data)
{
    constexpr u64 kOffsetBasis = 14695981039346656037ULL;
    constexpr u64 kPrime = 1099511628211ULL;

    u64 hash = kOffsetBasis;
    for (const char c : data)
    {
        hash ^= static_cast<u8>(c);
        hash *= kPrime;
    }
    return hash;
}

} // namespace meridian::core
