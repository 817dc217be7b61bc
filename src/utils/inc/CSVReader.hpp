#pragma once

#include <stdexcept>
#include <string>
#include <vector>


class CSVParseError : public std::runtime_error {
public:
    CSVParseError(const std::string& message, size_t line)
        : std::runtime_error(message), line_(line) {}

    size_t line() const noexcept { return line_; }

private:
    size_t line_;
};


// Tokenizes CSV text: quoted fields, doubled quotes, delimiters and line
// breaks inside quotes, CRLF line endings and a leading UTF-8 BOM.
// Blank lines are dropped.
class CSVReader {
public:
    using Row = std::vector<std::string>;

    explicit CSVReader(const std::string& text, bool has_header = true, char delimiter = ',');

    static CSVReader from_file(const std::string& file_path, bool has_header = true, char delimiter = ',');
    static std::string load_file(const std::string& file_path);

    const Row& header() const { return header_; }
    size_t column_count() const;
    size_t row_count() const { return rows_.size(); }
    const std::vector<Row>& read_all() const { return rows_; }

private:
    Row header_;
    std::vector<Row> rows_;

    void parse(const std::string& text, bool has_header, char delimiter);
};
