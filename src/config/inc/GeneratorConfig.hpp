#pragma once

#include "RowSourceConfig.hpp"
#include "ScriptLayout.hpp"
#include <string>

struct CredentialConfig {
    std::string user;
    std::string password;
};

struct OutputConfig {
    std::string dir;          // empty: directory of the CSV file
    bool to_stdout = false;
};

struct LogConfig {
    std::string dir = "log/";
    std::string level = "info";
    bool verbose = false;
};

struct GeneratorConfig {
    RowSourceConfig input;
    std::string script_path;
    CredentialConfig credentials;
    ScriptLayout layout;
    OutputConfig output;
    LogConfig log;
};
