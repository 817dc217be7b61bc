#pragma once

#include "GeneratedDocument.hpp"
#include "GeneratorConfig.hpp"
#include "ScriptGenerator.hpp"
#include "ScriptFileWriter.hpp"
#include <chrono>
#include <filesystem>
#include <iosfwd>
#include <optional>


struct GenerationResult {
    GeneratedDocument document;
    size_t record_count = 0;
    std::optional<std::filesystem::path> output_path;   // unset when printed to stdout
};


// One generation run: load CSV, assemble the script, persist or print it.
// Any failure aborts the run before anything is written.
class GenerationJob {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    explicit GenerationJob(const GeneratorConfig& config);

    GenerationJob(const GenerationJob&) = delete;
    GenerationJob& operator=(const GenerationJob&) = delete;

    GenerationResult run(TimePoint now = std::chrono::system_clock::now());

    // Stream used when output.to_stdout is set
    void set_output_stream(std::ostream& out) { out_ = &out; }

private:
    void check_inputs() const;

    GeneratorConfig config_;
    ScriptGenerator generator_;
    ScriptFileWriter writer_;
    std::ostream* out_;
};
