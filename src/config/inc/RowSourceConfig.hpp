#pragma once

#include <stdexcept>
#include <string>

struct RowSourceConfig {
    std::string file_path;
    std::string delimiter = ",";
    bool trim_values = true;

    char delimiter_char() const {
        if (delimiter.size() != 1) {
            throw std::invalid_argument("CSV delimiter must be a single character, got: '" + delimiter + "'");
        }
        return delimiter[0];
    }
};
