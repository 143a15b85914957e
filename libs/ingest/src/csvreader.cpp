#include "csvreader.h"

namespace infraget
{

std::string trim(std::string_view s)
{
    constexpr auto whitespace = " \t\r\n";
    auto first = s.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
        return {};
    auto last = s.find_last_not_of(whitespace);
    return std::string(s.substr(first, last - first + 1));
}

CsvReader::CsvReader(std::istream& input, char separator)
    : input_(input), separator_(separator)
{
    if (readRecord(header_) && !header_.empty()) {
        // Drop UTF-8 byte order mark.
        auto& first = header_.front();
        if (first.rfind("\xEF\xBB\xBF", 0) == 0)
            first.erase(0, 3);
        for (auto& column : header_)
            column = trim(column);
    }
}

std::vector<std::string> const& CsvReader::header() const
{
    return header_;
}

bool CsvReader::next(std::vector<std::string>& row)
{
    while (readRecord(row)) {
        // Skip blank lines.
        if (row.size() == 1 && trim(row.front()).empty())
            continue;
        return true;
    }
    return false;
}

size_t CsvReader::line() const
{
    return recordLine_;
}

bool CsvReader::readRecord(std::vector<std::string>& fields)
{
    fields.clear();
    std::string line;
    if (!std::getline(input_, line))
        return false;
    ++currentLine_;
    recordLine_ = currentLine_;

    std::string field;
    bool inQuotes = false;
    while (true) {
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (inQuotes) {
                if (c == '"') {
                    if (i + 1 < line.size() && line[i + 1] == '"') {
                        field += '"';
                        ++i;
                    }
                    else
                        inQuotes = false;
                }
                else
                    field += c;
            }
            else if (c == '"')
                inQuotes = true;
            else if (c == separator_) {
                fields.push_back(std::move(field));
                field.clear();
            }
            else if (c == '\r' && i + 1 == line.size())
                continue;
            else
                field += c;
        }

        // A quoted field may span multiple lines.
        if (inQuotes && std::getline(input_, line)) {
            ++currentLine_;
            field += '\n';
            continue;
        }
        break;
    }
    fields.push_back(std::move(field));
    return true;
}

}
