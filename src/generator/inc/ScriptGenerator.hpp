#pragma once

#include "GeneratedDocument.hpp"
#include "RowSourceConfig.hpp"
#include "ScriptAssembler.hpp"
#include "ScriptLayout.hpp"
#include "ServerDatabaseRecord.hpp"
#include "ServerListCSVReader.hpp"
#include <chrono>
#include <string>


// Entry points for callers that own the input surface (CLI, GUI).
// Holds no state between calls besides its immutable configuration.
class ScriptGenerator {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    explicit ScriptGenerator(const RowSourceConfig& source = RowSourceConfig{},
                             const ScriptLayout& layout = ScriptLayout{});

    ServerDatabaseRecordVector read_records(const std::string& csv_text) const;

    GeneratedDocument generate_document(const ServerDatabaseRecordVector& records,
                                        const std::string& script_path,
                                        const std::string& username,
                                        const std::string& password,
                                        TimePoint now) const;

private:
    ServerListCSVReader reader_;
    ScriptAssembler assembler_;
};
