#include "ScriptFileWriter.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

fs::path make_workspace(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("sqlcmdgen_writer_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

GeneratedDocument sample_document() {
    GeneratedDocument document;
    document.content = ":setvar USERNAME \"alice\"\n";
    document.suggested_filename = "run_all_20260103_213522.sql";
    return document;
}

}

void test_writes_beside_csv() {
    fs::path dir = make_workspace("beside");
    ScriptFileWriter writer(OutputConfig{});

    fs::path written = writer.write(sample_document(), dir / "servers.csv");

    assert(written == dir / "run_all_20260103_213522.sql");
    assert(read_file(written) == ":setvar USERNAME \"alice\"\n");
    fs::remove_all(dir);
    std::cout << "test_writes_beside_csv passed\n";
}

void test_configured_directory_is_created() {
    fs::path dir = make_workspace("configured");
    OutputConfig config;
    config.dir = (dir / "nested" / "out").string();
    ScriptFileWriter writer(config);

    fs::path written = writer.write(sample_document(), dir / "servers.csv");

    assert(written.parent_path() == dir / "nested" / "out");
    assert(fs::exists(written));
    fs::remove_all(dir);
    std::cout << "test_configured_directory_is_created passed\n";
}

void test_same_second_collisions_get_suffix() {
    fs::path dir = make_workspace("collision");
    ScriptFileWriter writer(OutputConfig{});
    const fs::path csv = dir / "servers.csv";

    fs::path first = writer.write(sample_document(), csv);
    fs::path second = writer.write(sample_document(), csv);
    fs::path third = writer.write(sample_document(), csv);

    assert(first.filename() == "run_all_20260103_213522.sql");
    assert(second.filename() == "run_all_20260103_213522_01.sql");
    assert(third.filename() == "run_all_20260103_213522_02.sql");

    // Lexicographic order still follows generation order, and the next second sorts after all of them
    const std::string next_second = "run_all_20260103_213523.sql";
    assert(first.filename().string() < second.filename().string());
    assert(second.filename().string() < third.filename().string());
    assert(third.filename().string() < next_second);

    fs::remove_all(dir);
    std::cout << "test_same_second_collisions_get_suffix passed\n";
}

void test_existing_file_is_never_replaced() {
    fs::path dir = make_workspace("existing");
    ScriptFileWriter writer(OutputConfig{});

    // Another run already created this second's file
    std::ofstream(dir / "run_all_20260103_213522.sql", std::ios::binary) << "other run\n";

    fs::path written = writer.write(sample_document(), dir / "servers.csv");

    assert(written.filename() == "run_all_20260103_213522_01.sql");
    assert(read_file(dir / "run_all_20260103_213522.sql") == "other run\n");
    assert(read_file(written) == sample_document().content);
    fs::remove_all(dir);
    std::cout << "test_existing_file_is_never_replaced passed\n";
}

void test_candidate_names() {
    const fs::path dir = "out";
    const std::string name = "run_all_20260103_213522.sql";
    assert(ScriptFileWriter::candidate_path(dir, name, 0) == dir / "run_all_20260103_213522.sql");
    assert(ScriptFileWriter::candidate_path(dir, name, 7) == dir / "run_all_20260103_213522_07.sql");
    assert(ScriptFileWriter::candidate_path(dir, name, 99) == dir / "run_all_20260103_213522_99.sql");
    std::cout << "test_candidate_names passed\n";
}

void test_collision_limit() {
    fs::path dir = make_workspace("limit");
    ScriptFileWriter writer(OutputConfig{});

    std::ofstream(dir / "run_all_20260103_213522.sql") << "x";
    for (int i = 1; i <= ScriptFileWriter::MAX_COLLISION_SUFFIX; ++i) {
        std::ostringstream name;
        name << "run_all_20260103_213522_" << (i < 10 ? "0" : "") << i << ".sql";
        std::ofstream(dir / name.str()) << "x";
    }

    try {
        writer.write(sample_document(), dir / "servers.csv");
        assert(false && "Expected runtime_error when every suffix is taken");
    } catch (const std::runtime_error& e) {
        assert(std::string(e.what()).find("run_all_20260103_213522.sql") != std::string::npos);
    }
    fs::remove_all(dir);
    std::cout << "test_collision_limit passed\n";
}

void test_relative_csv_uses_current_directory() {
    ScriptFileWriter writer(OutputConfig{});
    assert(writer.output_directory("servers.csv") == fs::current_path());
    std::cout << "test_relative_csv_uses_current_directory passed\n";
}

int main() {
    test_writes_beside_csv();
    test_configured_directory_is_created();
    test_same_second_collisions_get_suffix();
    test_existing_file_is_never_replaced();
    test_candidate_names();
    test_collision_limit();
    test_relative_csv_uses_current_directory();

    std::cout << "All ScriptFileWriter tests passed!\n";
    return 0;
}
