#include "CSVReader.hpp"
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>


CSVReader::CSVReader(const std::string& text, bool has_header, char delimiter) {
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw std::invalid_argument(std::string("Invalid CSV delimiter: '") + delimiter + "'");
    }
    parse(text, has_header, delimiter);
}

CSVReader CSVReader::from_file(const std::string& file_path, bool has_header, char delimiter) {
    return CSVReader(load_file(file_path), has_header, delimiter);
}

std::string CSVReader::load_file(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open CSV file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Failed to read CSV file: " + file_path);
    }
    return buffer.str();
}

size_t CSVReader::column_count() const {
    if (!header_.empty()) {
        return header_.size();
    }
    return rows_.empty() ? 0 : rows_.front().size();
}

void CSVReader::parse(const std::string& text, bool has_header, char delimiter) {
    static const std::string utf8_bom = "\xEF\xBB\xBF";

    std::vector<Row> rows;
    Row row;
    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;
    bool row_has_content = false;
    size_t line = 1;
    size_t quote_line = 0;

    auto end_field = [&]() {
        row.push_back(std::move(field));
        field.clear();
        field_quoted = false;
    };

    auto end_row = [&]() {
        end_field();
        if (row_has_content) {
            rows.push_back(std::move(row));
        }
        row.clear();
        row_has_content = false;
    };

    size_t i = text.compare(0, utf8_bom.size(), utf8_bom) == 0 ? utf8_bom.size() : 0;
    const size_t n = text.size();

    for (; i < n; ++i) {
        const char c = text[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < n && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') ++line;
                field += c;
            }
            continue;
        }

        if (c == '"' && field.empty() && !field_quoted) {
            in_quotes = true;
            field_quoted = true;
            row_has_content = true;
            quote_line = line;
        } else if (c == delimiter) {
            end_field();
            row_has_content = true;
        } else if (c == '\r') {
            if (i + 1 < n && text[i + 1] == '\n') {
                continue;
            }
            end_row();
            ++line;
        } else if (c == '\n') {
            end_row();
            ++line;
        } else {
            field += c;
            if (!std::isspace(static_cast<unsigned char>(c))) {
                row_has_content = true;
            }
        }
    }

    if (in_quotes) {
        throw CSVParseError("Unterminated quoted field starting at line " + std::to_string(quote_line), quote_line);
    }

    if (row_has_content || !field.empty() || !row.empty()) {
        end_row();
    }

    auto it = rows.begin();
    if (has_header && it != rows.end()) {
        header_ = std::move(*it);
        ++it;
    }
    rows_.assign(std::make_move_iterator(it), std::make_move_iterator(rows.end()));
}
