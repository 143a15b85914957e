#pragma once

#include <istream>
#include <string_view>
#include <string>
#include <vector>

namespace infraget
{

/**
 * Reader for delimited text with a header line. Fields may be enclosed
 * in double quotes, in which case they may contain the separator, line
 * breaks, and doubled quotes. Carriage returns at line ends and a leading
 * UTF-8 byte order mark are dropped.
 */
class CsvReader
{
public:
    CsvReader(std::istream& input, char separator);

    /** Column names from the first line. Empty if the input was empty. */
    [[nodiscard]] std::vector<std::string> const& header() const;

    /**
     * Read the next row into `row`.
     * @return false at the end of the input.
     */
    bool next(std::vector<std::string>& row);

    /** Line number at which the most recently read row started (1-based). */
    [[nodiscard]] size_t line() const;

private:
    bool readRecord(std::vector<std::string>& fields);

    std::istream& input_;
    char separator_;
    std::vector<std::string> header_;
    size_t currentLine_ = 0;
    size_t recordLine_ = 0;
};

/** Remove leading and trailing whitespace. */
std::string trim(std::string_view s);

}
