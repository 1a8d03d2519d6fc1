#pragma once

/// @file csv.hpp
/// @brief Strict CSV reading and field parsing shared by the dataset loaders.

#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meridian::core
{
    /// @brief One data row of a CSV file, with its 1-based source line number.
    struct CsvRow
    {
        u32 line_number;
        std::vector<std::string> fields;
    };

    /// @brief A fully read CSV file: header columns, data rows and raw content.
    struct CsvDocument
    {
        std::vector<std::string> header;
        std::vector<CsvRow> rows;
        std::string content;    ///< Raw file bytes (used for dataset checksums)
    };

    /// @brief Static utility class for the datasets Meridian loads at startup.
    ///
    /// Datasets are read strictly: a header row is required, blank lines and
    /// lines starting with '#' are ignored, and every data row must have exactly
    /// the header's column count. Fields may be double-quoted to embed commas;
    /// a doubled quote inside a quoted field is a literal quote.
    class Csv
    {
    public:
        Csv() = delete;

        /// @brief Read a CSV file with the given column layout.
        /// @param path Path to the file.
        /// @param expected_header Column names the header must match (case-insensitive).
        /// @param what Dataset name used in log messages.
        /// @return The document, or std::nullopt (reason logged) on any structural error.
        [[nodiscard]] static std::optional<CsvDocument> read_file(
            const std::filesystem::path& path,
            const std::vector<std::string_view>& expected_header,
            std::string_view what);

        /// @brief Split one line into fields, honouring double quotes.
        /// @return The fields, or std::nullopt if a quoted field is unterminated.
        [[nodiscard]] static std::optional<std::vector<std::string>> split(std::string_view line);

        /// @brief Render a value as one double-quoted field, doubling embedded quotes.
        /// split() reads the result back as the original value.
        [[nodiscard]] static std::string quote(std::string_view value);

        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a finite f64 from a trimmed string_view.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);

        /// @brief Parse an i64 from a trimmed string_view.
        [[nodiscard]] static std::optional<i64> parse_i64(std::string_view sv);
    };

    /// @brief 64-bit FNV-1a hash, stable across runs and platforms.
    [[nodiscard]] u64 fnv1a_64(std::string_view data);

} // namespace meridian::core
