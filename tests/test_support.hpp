#pragma once

/// @file test_support.hpp
/// @brief Shared helpers for the Meridian test suites.

#include <filesystem>
#include <fstream>
#include <string>

namespace meridian::test
{
    /// @brief Writes content to a file in the temp directory, removed on destruction.
    class TempCsvFile
    {
    public:
        explicit TempCsvFile(const std::string& filename, const std::string& content)
            : m_path(std::filesystem::temp_directory_path() / filename)
        {
            std::ofstream file(m_path);
            file << content;
        }

        ~TempCsvFile()
        {
            std::error_code ec;
            std::filesystem::remove(m_path, ec);
        }

        [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

        TempCsvFile(const TempCsvFile&) = delete;
        TempCsvFile& operator=(const TempCsvFile&) = delete;

    private:
        std::filesystem::path m_path;
    };

} // namespace meridian::test
