#pragma once

#include "GeneratedDocument.hpp"
#include "GeneratorConfig.hpp"
#include <filesystem>
#include <string>


class ScriptFileWriter {
public:
    static constexpr int MAX_COLLISION_SUFFIX = 99;

    explicit ScriptFileWriter(const OutputConfig& config);

    ScriptFileWriter(const ScriptFileWriter&) = delete;
    ScriptFileWriter& operator=(const ScriptFileWriter&) = delete;

    ~ScriptFileWriter() = default;

    // Configured directory, or the directory holding the CSV input
    std::filesystem::path output_directory(const std::filesystem::path& csv_path) const;

    // suffix 0 is <stem>.<ext>, otherwise <stem>_NN.<ext>
    static std::filesystem::path candidate_path(const std::filesystem::path& directory,
                                                const std::string& suggested_filename,
                                                int suffix);

    // Creates the first free candidate exclusively and never replaces an existing file.
    // Returns the path written
    std::filesystem::path write(const GeneratedDocument& document,
                                const std::filesystem::path& csv_path) const;

private:
    OutputConfig config_;
};
