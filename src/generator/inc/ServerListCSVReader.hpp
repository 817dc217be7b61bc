#pragma once

#include "RowSourceConfig.hpp"
#include "ServerDatabaseRecord.hpp"
#include <string>


class ServerListCSVReader {
public:
    static constexpr const char* SERVER_FIELD = "server";
    static constexpr const char* DATABASE_FIELD = "database";

    explicit ServerListCSVReader(const RowSourceConfig& config);

    ServerListCSVReader(const ServerListCSVReader&) = delete;
    ServerListCSVReader& operator=(const ServerListCSVReader&) = delete;
    ServerListCSVReader(ServerListCSVReader&&) = delete;
    ServerListCSVReader& operator=(ServerListCSVReader&&) = delete;

    ~ServerListCSVReader() = default;

    // Throws FormatError or EmptyInputError
    ServerDatabaseRecordVector parse(const std::string& csv_text) const;

    // Loads config.file_path and parses it
    ServerDatabaseRecordVector read_file() const;

private:
    RowSourceConfig config_;
    char delimiter_;

    void validate_config() const;
};
