/// @file test_csv.cpp
/// @brief Unit tests for meridian::core::Csv and fnv1a_64.
///
/// Verifies quote-aware splitting, numeric parsing, strict header and
/// column-count checks, and hash stability.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/csv.hpp"
#include "core/logger.hpp"
#include "test_support.hpp"

#include <string>

using namespace meridian;
using namespace meridian::core;
using meridian::test::TempCsvFile;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    Logger::init(LogConfig{.level = "warn"});
    const int result = doctest::Context(argc, argv).run();
    Logger::shutdown();
    return result;
}

// =================================================================
// Splitting
// =================================================================

TEST_CASE("Split plain fields and trim whitespace")
{
    const auto fields = Csv::split("a, b ,c");
    REQUIRE(fields.has_value());
    REQUIRE(fields->size() == 3);
    CHECK((*fields)[0] == "a");
    CHECK((*fields)[1] == "b");
    CHECK((*fields)[2] == "c");
}

TEST_CASE("Quoted fields keep commas and doubled quotes")
{
    const auto fields = Csv::split(R"(x,"Shanks, The American Atlas","say ""hi""",)");
    REQUIRE(fields.has_value());
    REQUIRE(fields->size() == 4);
    CHECK((*fields)[1] == "Shanks, The American Atlas");
    CHECK((*fields)[2] == R"(say "hi")");
    CHECK((*fields)[3].empty());
}

TEST_CASE("Quoting doubles embedded quotes and protects commas")
{
    CHECK(Csv::quote("America/New_York") == R"("America/New_York")");
    CHECK(Csv::quote("") == R"("")");
    CHECK(Csv::quote(R"(zone 'EST,x' is "unknown")") == R"("zone 'EST,x' is ""unknown""")");

    const std::string row = "7,error," + Csv::quote(R"(bad "value", see line 7)");
    const auto fields = Csv::split(row);
    REQUIRE(fields.has_value());
    REQUIRE(fields->size() == 3);
    CHECK((*fields)[2] == R"(bad "value", see line 7)");
}

TEST_CASE("Unterminated quote is an error")
{
    CHECK_FALSE(Csv::split(R"(a,"open)").has_value());
}

// =================================================================
// Numbers
// =================================================================

TEST_CASE("parse_f64 accepts signs and rejects junk")
{
    CHECK(*Csv::parse_f64(" -85.963 ") == doctest::Approx(-85.963));
    CHECK(*Csv::parse_f64("+1.5") == doctest::Approx(1.5));
    CHECK_FALSE(Csv::parse_f64("").has_value());
    CHECK_FALSE(Csv::parse_f64("12abc").has_value());
    CHECK_FALSE(Csv::parse_f64("inf").has_value());
    CHECK_FALSE(Csv::parse_f64("nan").has_value());
}

TEST_CASE("parse_i64 accepts integers only")
{
    CHECK(Csv::parse_i64("-21600") == -21600);
    CHECK(Csv::parse_i64("+3600") == 3600);
    CHECK_FALSE(Csv::parse_i64("1.5").has_value());
    CHECK_FALSE(Csv::parse_i64("x").has_value());
}

// =================================================================
// Files
// =================================================================

TEST_CASE("read_file skips comments and blank lines")
{
    const TempCsvFile csv("meridian_csv_ok.csv",
        "# comment\n"
        "\n"
        "Name,Value\n"
        "alpha,1\n"
        "# another comment\n"
        "beta,2\n");

    const auto doc = Csv::read_file(csv.path(), {"Name", "Value"}, "test");
    REQUIRE(doc.has_value());
    REQUIRE(doc->rows.size() == 2);
    CHECK(doc->rows[0].fields[0] == "alpha");
    CHECK(doc->rows[0].line_number == 4);
    CHECK(doc->rows[1].line_number == 6);
    CHECK_FALSE(doc->content.empty());
}

TEST_CASE("read_file matches the header case-insensitively")
{
    const TempCsvFile csv("meridian_csv_case.csv", "name,VALUE\nalpha,1\n");
    CHECK(Csv::read_file(csv.path(), {"Name", "Value"}, "test").has_value());
}

TEST_CASE("read_file rejects a wrong header")
{
    const TempCsvFile csv("meridian_csv_header.csv", "Name,Other\nalpha,1\n");
    CHECK_FALSE(Csv::read_file(csv.path(), {"Name", "Value"}, "test").has_value());
}

TEST_CASE("read_file rejects a row with the wrong column count")
{
    const TempCsvFile csv("meridian_csv_columns.csv", "Name,Value\nalpha,1\nbeta\n");
    CHECK_FALSE(Csv::read_file(csv.path(), {"Name", "Value"}, "test").has_value());
}

TEST_CASE("read_file fails on a missing or empty file")
{
    CHECK_FALSE(Csv::read_file("/nonexistent/meridian.csv", {"Name"}, "test").has_value());

    const TempCsvFile csv("meridian_csv_empty.csv", "# only a comment\n");
    CHECK_FALSE(Csv::read_file(csv.path(), {"Name"}, "test").has_value());
}

TEST_CASE("Header-only file yields no rows")
{
    const TempCsvFile csv("meridian_csv_header_only.csv", "Name,Value\n");
    const auto doc = Csv::read_file(csv.path(), {"Name", "Value"}, "test");
    REQUIRE(doc.has_value());
    CHECK(doc->rows.empty());
}

// =================================================================
// Hash
// =================================================================

TEST_CASE("FNV-1a matches the published test vectors")
{
    CHECK(fnv1a_64("") == 0xcbf29ce484222325ULL);
    CHECK(fnv1a_64("a") == 0xaf63dc4c8601ec8cULL);
    CHECK(fnv1a_64("foobar") == 0x85944171f73967e8ULL);
}
