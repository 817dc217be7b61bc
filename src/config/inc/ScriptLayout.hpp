#pragma once

#include <stdexcept>
#include <string>

struct ScriptLayout {
    bool include_banner = true;
    std::string line_ending = "lf";
    std::string filename_prefix = "run_all_";
    std::string filename_extension = "sql";
    bool utc_timestamps = false;

    const char* newline() const {
        if (line_ending == "lf") return "\n";
        if (line_ending == "crlf") return "\r\n";
        throw std::invalid_argument("Invalid line_ending: " + line_ending + ", expected 'lf' or 'crlf'");
    }

    void validate() const {
        newline();

        if (filename_extension.empty()) {
            throw std::invalid_argument("Output file extension cannot be empty");
        }
        if (filename_prefix.find_first_of("/\\") != std::string::npos
            || filename_extension.find_first_of("/\\.") != std::string::npos) {
            throw std::invalid_argument("Output file prefix and extension must not contain path separators");
        }
    }
};
