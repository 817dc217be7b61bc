#pragma once

#include "ServerDatabaseRecord.hpp"
#include <string>

struct GenerationRequest {
    ServerDatabaseRecordVector records;
    std::string script_path;
    std::string username;
    std::string password;
};
