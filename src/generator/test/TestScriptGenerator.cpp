#include "ScriptGenerator.hpp"
#include "GeneratorErrors.hpp"
#include "StringUtils.hpp"
#include "TimestampUtils.hpp"
#include <cassert>
#include <iostream>
#include <string>


namespace {

ScriptLayout utc_layout() {
    ScriptLayout layout;
    layout.utc_timestamps = true;
    return layout;
}

}

void test_two_server_scenario() {
    ScriptGenerator generator(RowSourceConfig{}, utc_layout());
    auto now = TimestampUtils::from_utc(2026, 1, 3, 21, 35, 22);

    auto records = generator.read_records("server,database\nSrvA,DB1\nSrvB,DB2\n");
    assert(records.size() == 2);

    auto document = generator.generate_document(records, "setup.sql", "alice", "secret", now);
    const std::string& content = document.content;

    const size_t user_pos = content.find(":setvar USERNAME \"alice\"");
    const size_t pass_pos = content.find(":setvar PASSWORD \"secret\"");
    const size_t script_pos = content.find(":setvar SCRIPT \"setup.sql\"");
    const size_t block1 = content.find("PRINT '--- [1] DB1 on SrvA ---'");
    const size_t connect1 = content.find(":CONNECT SrvA -U $(USERNAME) -P $(PASSWORD)");
    const size_t use1 = content.find("USE [DB1];");
    const size_t block2 = content.find("PRINT '--- [2] DB2 on SrvB ---'");
    const size_t connect2 = content.find(":CONNECT SrvB -U $(USERNAME) -P $(PASSWORD)");
    const size_t use2 = content.find("USE [DB2];");

    assert(user_pos != std::string::npos && pass_pos != std::string::npos && script_pos != std::string::npos);
    assert(block1 != std::string::npos && block2 != std::string::npos);
    assert(user_pos < block1 && pass_pos < block1 && script_pos < block1);
    assert(block1 < connect1 && connect1 < use1 && use1 < block2);
    assert(block2 < connect2 && connect2 < use2);

    assert(StringUtils::count_occurrences(content, "PRINT '--- [") == 2);
    assert(StringUtils::count_occurrences(content, "\nGO\n") == 2);
    assert(StringUtils::count_occurrences(content, "alice") == 1);
    assert(StringUtils::count_occurrences(content, "secret") == 1);
    assert(document.suggested_filename == "run_all_20260103_213522.sql");
    std::cout << "test_two_server_scenario passed\n";
}

void test_same_server_many_databases() {
    ScriptGenerator generator(RowSourceConfig{}, utc_layout());
    auto now = TimestampUtils::from_utc(2026, 1, 3, 21, 35, 22);

    auto records = generator.read_records("server,database\nSrvA,DB1\nSrvA,DB2\nSrvA,DB3\n");
    auto content = generator.generate_document(records, "setup.sql", "alice", "secret", now).content;

    // One :CONNECT per block even when the server repeats
    assert(StringUtils::count_occurrences(content, ":CONNECT SrvA ") == 3);
    assert(content.find("[3] DB3 on SrvA") != std::string::npos);
    std::cout << "test_same_server_many_databases passed\n";
}

void test_generate_with_no_records() {
    ScriptGenerator generator;
    try {
        generator.generate_document({}, "setup.sql", "alice", "secret", std::chrono::system_clock::now());
        assert(false && "Expected EmptyInputError for empty record list");
    } catch (const EmptyInputError&) {
        std::cout << "test_generate_with_no_records passed\n";
    }
}

void test_read_records_errors_propagate() {
    ScriptGenerator generator;
    try {
        generator.read_records("server\nSrvA\n");
        assert(false && "Expected FormatError for missing database");
    } catch (const FormatError& e) {
        assert(e.field() == "database");
    }

    try {
        generator.read_records("server,database\n");
        assert(false && "Expected EmptyInputError for header only");
    } catch (const EmptyInputError&) {
    }
    std::cout << "test_read_records_errors_propagate passed\n";
}

int main() {
    test_two_server_scenario();
    test_same_server_many_databases();
    test_generate_with_no_records();
    test_read_records_errors_propagate();

    std::cout << "All ScriptGenerator tests passed!\n";
    return 0;
}
