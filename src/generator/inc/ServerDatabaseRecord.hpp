#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct ServerDatabaseRecord {
    std::string server;
    std::string database;
    size_t ordinal = 0;

    bool operator==(const ServerDatabaseRecord& other) const {
        return server == other.server && database == other.database && ordinal == other.ordinal;
    }
};

using ServerDatabaseRecordVector = std::vector<ServerDatabaseRecord>;
