#pragma once

#include <string>
#include <vector>
#include <sstream>
#include <iomanip>


class TableBuilder
{
public:
    // The header row is followed by a rule spanning the table width.
    void set_header(std::vector<std::string> row)
    {
        widen(row);
        header = std::move(row);
    }

    void add_row(std::vector<std::string> row)
    {
        widen(row);
        rows.push_back(std::move(row));
    }

    std::string build() const
    {
        std::ostringstream ss;

        if (!header.empty())
        {
            write_row(ss, header);

            size_t width = 0;
            for (size_t w : columnWidths)
            {
                width += w + 2;
            }
            ss << std::string(width > 2 ? width - 2 : width, '-') << "\n";
        }

        for (const auto& row : rows)
        {
            write_row(ss, row);
        }

        return ss.str();
    }

private:
    void widen(const std::vector<std::string>& row)
    {
        if (row.size() > columnWidths.size())
        {
            columnWidths.resize(row.size(), 0);
        }

        for (size_t i = 0; i < row.size(); ++i)
        {
            if (row[i].size() > columnWidths[i])
            {
                columnWidths[i] = row[i].size();
            }
        }
    }

    void write_row(std::ostringstream& ss, const std::vector<std::string>& row) const
    {
        for (size_t i = 0; i < row.size(); ++i)
        {
            if (i + 1 == row.size())
            {
                ss << row[i];
            }
            else
            {
                ss << std::left << std::setw(static_cast<int>(columnWidths[i] + 2)) << row[i];
            }
        }
        ss << "\n";
    }

    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    std::vector<size_t> columnWidths;
};
