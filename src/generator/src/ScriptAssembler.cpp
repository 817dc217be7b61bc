#include "ScriptAssembler.hpp"
#include "GeneratorErrors.hpp"
#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include "TimestampUtils.hpp"
#include <stdexcept>
#include <string>
#include <vector>


namespace {

const std::string banner_rule(60, '-');

bool has_line_break(const std::string& value) {
    return value.find_first_of("\r\n") != std::string::npos;
}

}


ScriptAssembler::ScriptAssembler(const ScriptLayout& layout)
    : layout_(layout) {

    layout_.validate();
}

std::string ScriptAssembler::quote_setvar_value(const std::string& value) {
    return "\"" + StringUtils::replace_all(value, "\"", "\"\"") + "\"";
}

std::string ScriptAssembler::escape_string_literal(const std::string& value) {
    return StringUtils::replace_all(value, "'", "''");
}

std::string ScriptAssembler::quote_identifier(const std::string& name) {
    return "[" + StringUtils::replace_all(name, "]", "]]") + "]";
}

std::string ScriptAssembler::suggested_filename(TimePoint generated_at) const {
    return fmt::format("{}{}.{}",
                       layout_.filename_prefix,
                       TimestampUtils::format_compact(generated_at, layout_.utc_timestamps),
                       layout_.filename_extension);
}

GeneratedDocument ScriptAssembler::assemble(const GenerationRequest& request, TimePoint generated_at) const {
    if (request.records.empty()) {
        throw EmptyInputError("No rows to process: generation request has no server/database records");
    }

    if (has_line_break(request.username)) {
        throw std::invalid_argument("USERNAME must not contain a line break");
    }
    if (has_line_break(request.password)) {
        throw std::invalid_argument("PASSWORD must not contain a line break");
    }
    if (has_line_break(request.script_path)) {
        throw std::invalid_argument("SCRIPT path must not contain a line break");
    }
    for (const auto& record : request.records) {
        if (has_line_break(record.server)) {
            throw FormatError(fmt::format("Row {} has a line break in the 'server' value", record.ordinal),
                              "server", record.ordinal);
        }
        if (has_line_break(record.database)) {
            throw FormatError(fmt::format("Row {} has a line break in the 'database' value", record.ordinal),
                              "database", record.ordinal);
        }
    }

    if (request.username.empty()) {
        LogUtils::warn("USERNAME is empty; every :CONNECT will use an empty login");
    }
    if (request.password.empty()) {
        LogUtils::warn("PASSWORD is empty; every :CONNECT will use an empty password");
    }

    std::vector<std::string> lines;
    lines.reserve(16 + request.records.size() * 6);

    if (layout_.include_banner) {
        lines.push_back(banner_rule);
        lines.push_back("-- MULTI-DATABASE SQLCMD SCRIPT");
        lines.push_back("-- Enable: Query > SQLCMD Mode");
        lines.push_back(banner_rule);
        lines.emplace_back();
    }

    append_preamble(lines, request);
    lines.emplace_back();

    if (layout_.include_banner) {
        append_banner(lines, "-- BEGIN EXECUTION");
    }

    for (const auto& record : request.records) {
        append_block(lines, record);
    }

    GeneratedDocument document;
    document.content = join_lines(lines);
    document.suggested_filename = suggested_filename(generated_at);

    LogUtils::debug("Assembled {} execution blocks into {}", request.records.size(), document.suggested_filename);
    return document;
}

void ScriptAssembler::append_banner(std::vector<std::string>& lines, const std::string& title) const {
    lines.push_back(banner_rule);
    lines.push_back(title);
    lines.push_back(banner_rule);
    lines.emplace_back();
}

void ScriptAssembler::append_preamble(std::vector<std::string>& lines, const GenerationRequest& request) const {
    lines.push_back(":setvar USERNAME " + quote_setvar_value(request.username));
    lines.push_back(":setvar PASSWORD " + quote_setvar_value(request.password));
    lines.push_back(":setvar SCRIPT " + quote_setvar_value(request.script_path));
}

void ScriptAssembler::append_block(std::vector<std::string>& lines, const ServerDatabaseRecord& record) const {
    // Credentials only ever appear as $(USERNAME)/$(PASSWORD) after the preamble
    lines.push_back(fmt::format("PRINT '--- [{}] {} on {} ---'",
                                record.ordinal,
                                escape_string_literal(record.database),
                                escape_string_literal(record.server)));
    lines.push_back(fmt::format(":CONNECT {} -U $(USERNAME) -P $(PASSWORD)", record.server));
    lines.push_back(fmt::format("USE {};", quote_identifier(record.database)));
    lines.push_back(":r $(SCRIPT)");
    lines.push_back("GO");
    lines.emplace_back();
}

std::string ScriptAssembler::join_lines(const std::vector<std::string>& lines) const {
    const std::string newline = layout_.newline();

    // Every block ends with an empty entry; the document ends with exactly one line break
    size_t count = lines.size();
    while (count > 0 && lines[count - 1].empty()) {
        --count;
    }

    std::string content;
    for (size_t i = 0; i < count; ++i) {
        content += lines[i];
        content += newline;
    }
    return content;
}
