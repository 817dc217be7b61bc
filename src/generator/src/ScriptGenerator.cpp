#include "ScriptGenerator.hpp"
#include "GenerationRequest.hpp"


ScriptGenerator::ScriptGenerator(const RowSourceConfig& source, const ScriptLayout& layout)
    : reader_(source), assembler_(layout) {}

ServerDatabaseRecordVector ScriptGenerator::read_records(const std::string& csv_text) const {
    return reader_.parse(csv_text);
}

GeneratedDocument ScriptGenerator::generate_document(const ServerDatabaseRecordVector& records,
                                                     const std::string& script_path,
                                                     const std::string& username,
                                                     const std::string& password,
                                                     TimePoint now) const {
    GenerationRequest request;
    request.records = records;
    request.script_path = script_path;
    request.username = username;
    request.password = password;
    return assembler_.assemble(request, now);
}
