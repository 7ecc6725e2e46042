// utils/csv.hpp
#pragma once
#include <cctype>
#include <cstddef>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace utils
{

    /**
     * CsvTable - Whole-file CSV table with a named header
     *
     * Rows keep the source line they came from so loaders can report
     * "file:line" on bad input. Lines starting with '#' and blank lines
     * are skipped. Fields may be double-quoted ("" escapes a quote).
     */
    class CsvTable
    {
    public:
        struct Row
        {
            size_t line = 0;
            std::vector<std::string> cells;
        };

        bool load(const std::string &path)
        {
            std::ifstream in(path);
            if (!in.is_open())
                return false;
            return parse(in);
        }

        bool parse(std::istream &in)
        {
            header_.clear();
            index_.clear();
            rows_.clear();

            std::string line;
            size_t line_no = 0;
            bool have_header = false;

            while (std::getline(in, line))
            {
                ++line_no;
                if (skip(line))
                    continue;

                std::vector<std::string> cells = split(line);
                if (!have_header)
                {
                    header_ = cells;
                    for (size_t i = 0; i < header_.size(); ++i)
                        index_[header_[i]] = i;
                    have_header = true;
                    continue;
                }

                if (cells.size() < header_.size())
                    cells.resize(header_.size());
                rows_.push_back({line_no, std::move(cells)});
            }
            return have_header;
        }

        bool has_column(const std::string &name) const { return index_.count(name) > 0; }

        const std::vector<std::string> &header() const { return header_; }
        const std::vector<Row> &rows() const { return rows_; }

        /** Cell text, empty when the column is unknown */
        const std::string &text(const Row &row, const std::string &column) const
        {
            static const std::string empty;
            auto it = index_.find(column);
            if (it == index_.end() || it->second >= row.cells.size())
                return empty;
            return row.cells[it->second];
        }

        /**
         * Numeric cell. Empty cells give fallback.
         * @throws std::invalid_argument naming the line and column on bad text
         */
        double number(const Row &row, const std::string &column, double fallback = 0.0) const
        {
            const std::string &s = text(row, column);
            if (s.empty())
                return fallback;

            size_t used = 0;
            double v = 0.0;
            try
            {
                v = std::stod(s, &used);
            }
            catch (const std::logic_error &)
            {
                used = 0;
            }
            if (used != s.size())
            {
                throw std::invalid_argument("line " + std::to_string(row.line) + ": column '" +
                                            column + "' is not a number: '" + s + "'");
            }
            return v;
        }

    private:
        static bool skip(const std::string &line)
        {
            for (char c : line)
            {
                if (c == '#')
                    return true;
                if (!std::isspace(static_cast<unsigned char>(c)))
                    return false;
            }
            return true;
        }

        static std::string trimmed(const std::string &s)
        {
            size_t b = 0;
            size_t e = s.size();
            while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
                ++b;
            while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
                --e;
            return s.substr(b, e - b);
        }

        static std::vector<std::string> split(const std::string &line)
        {
            std::vector<std::string> out;
            std::string cell;
            bool quoted = false;

            for (size_t i = 0; i < line.size(); ++i)
            {
                const char c = line[i];
                if (quoted)
                {
                    if (c != '"')
                        cell.push_back(c);
                    else if (i + 1 < line.size() && line[i + 1] == '"')
                        cell.push_back(line[++i]);
                    else
                        quoted = false;
                }
                else if (c == '"')
                {
                    quoted = true;
                }
                else if (c == ',')
                {
                    out.push_back(trimmed(cell));
                    cell.clear();
                }
                else if (c != '\r')
                {
                    cell.push_back(c);
                }
            }
            out.push_back(trimmed(cell));
            return out;
        }

        std::vector<std::string> header_;
        std::unordered_map<std::string, size_t> index_;
        std::vector<Row> rows_;
    };

} // namespace utils
