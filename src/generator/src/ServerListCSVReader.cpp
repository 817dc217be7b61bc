#include "ServerListCSVReader.hpp"
#include "CSVReader.hpp"
#include "GeneratorErrors.hpp"
#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>


namespace {

std::optional<size_t> find_column(const CSVReader::Row& header, const std::string& name) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (StringUtils::trimmed(header[i]) == name) {
            return i;
        }
    }
    return std::nullopt;
}

}


ServerListCSVReader::ServerListCSVReader(const RowSourceConfig& config)
    : config_(config), delimiter_(config.delimiter_char()) {

    validate_config();
}

void ServerListCSVReader::validate_config() const {
    if (delimiter_ == '"' || delimiter_ == '\n' || delimiter_ == '\r') {
        throw std::invalid_argument(std::string("Invalid CSV delimiter: '") + delimiter_ + "'");
    }
}

ServerDatabaseRecordVector ServerListCSVReader::read_file() const {
    if (config_.file_path.empty()) {
        throw std::invalid_argument("CSV file path is empty for server list");
    }

    LogUtils::debug("Loading server list from {}", config_.file_path);
    return parse(CSVReader::load_file(config_.file_path));
}

ServerDatabaseRecordVector ServerListCSVReader::parse(const std::string& csv_text) const {
    std::optional<CSVReader> reader;
    try {
        reader.emplace(csv_text, true, delimiter_);
    } catch (const CSVParseError& e) {
        throw FormatError(e.what());
    }

    const auto& header = reader->header();

    // Header cells are matched case-sensitively, any column order
    const auto server_index = find_column(header, SERVER_FIELD);
    if (!server_index) {
        throw FormatError("Missing required field 'server' in CSV header", SERVER_FIELD);
    }

    const auto database_index = find_column(header, DATABASE_FIELD);
    if (!database_index) {
        throw FormatError("Missing required field 'database' in CSV header", DATABASE_FIELD);
    }

    const auto& rows = reader->read_all();
    if (rows.empty()) {
        throw EmptyInputError("No rows to process: CSV input has a header but no data rows");
    }

    const size_t required_columns = std::max(*server_index, *database_index) + 1;

    ServerDatabaseRecordVector records;
    records.reserve(rows.size());

    for (size_t row_idx = 0; row_idx < rows.size(); ++row_idx) {
        const auto& row = rows[row_idx];
        const size_t ordinal = row_idx + 1;

        if (row.size() < required_columns) {
            throw FormatError(
                fmt::format("Row {} has only {} columns, expected at least {}", ordinal, row.size(), required_columns),
                {}, ordinal);
        }

        ServerDatabaseRecord record;
        record.server = row[*server_index];
        record.database = row[*database_index];
        record.ordinal = ordinal;

        if (config_.trim_values) {
            StringUtils::trim(record.server);
            StringUtils::trim(record.database);
        }

        if (record.server.empty()) {
            throw FormatError(fmt::format("Row {} has an empty 'server' value", ordinal), SERVER_FIELD, ordinal);
        }
        if (record.database.empty()) {
            throw FormatError(fmt::format("Row {} has an empty 'database' value", ordinal), DATABASE_FIELD, ordinal);
        }

        // Quoted CSV cells may span lines; every value lands on a single script line
        if (record.server.find_first_of("\r\n") != std::string::npos) {
            throw FormatError(fmt::format("Row {} has a line break in the 'server' value", ordinal), SERVER_FIELD, ordinal);
        }
        if (record.database.find_first_of("\r\n") != std::string::npos) {
            throw FormatError(fmt::format("Row {} has a line break in the 'database' value", ordinal), DATABASE_FIELD, ordinal);
        }

        LogUtils::debug("Row {}: database '{}' on server '{}'", ordinal, record.database, record.server);
        records.push_back(std::move(record));
    }

    LogUtils::info("Read {} server/database rows", records.size());
    return records;
}
