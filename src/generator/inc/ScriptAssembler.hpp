#pragma once

#include "GeneratedDocument.hpp"
#include "GenerationRequest.hpp"
#include "ScriptLayout.hpp"
#include <chrono>
#include <string>
#include <vector>


// Builds a SQLCMD-mode script: a :setvar preamble binding USERNAME, PASSWORD
// and SCRIPT, followed by one self-contained execution block per record.
class ScriptAssembler {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    explicit ScriptAssembler(const ScriptLayout& layout = ScriptLayout{});

    // Throws EmptyInputError when request.records is empty
    GeneratedDocument assemble(const GenerationRequest& request, TimePoint generated_at) const;

    // <prefix>YYYYMMDD_HHMMSS.<extension>
    std::string suggested_filename(TimePoint generated_at) const;

    // Value for `:setvar NAME "value"`; embedded double quotes are doubled
    static std::string quote_setvar_value(const std::string& value);

    // Text inside a T-SQL '...' literal
    static std::string escape_string_literal(const std::string& value);

    // T-SQL [bracketed] identifier
    static std::string quote_identifier(const std::string& name);

private:
    ScriptLayout layout_;

    void append_banner(std::vector<std::string>& lines, const std::string& title) const;
    void append_preamble(std::vector<std::string>& lines, const GenerationRequest& request) const;
    void append_block(std::vector<std::string>& lines, const ServerDatabaseRecord& record) const;
    std::string join_lines(const std::vector<std::string>& lines) const;
};
