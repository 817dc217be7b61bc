#include "GenerationJob.hpp"
#include "CSVReader.hpp"
#include "LogUtils.hpp"
#include "TimestampUtils.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>


GenerationJob::GenerationJob(const GeneratorConfig& config)
    : config_(config),
      generator_(config.input, config.layout),
      writer_(config.output),
      out_(&std::cout) {}

void GenerationJob::check_inputs() const {
    if (config_.input.file_path.empty()) {
        throw std::invalid_argument("Missing CSV file; use --csv or input.csv in the config file");
    }
    if (config_.script_path.empty()) {
        throw std::invalid_argument("Missing SQL script; use --script or script in the config file");
    }
    if (!std::filesystem::exists(config_.input.file_path)) {
        throw std::runtime_error("CSV file not found: " + config_.input.file_path);
    }
    if (!std::filesystem::exists(config_.script_path)) {
        throw std::runtime_error("SQL script file not found: " + config_.script_path);
    }
}

GenerationResult GenerationJob::run(TimePoint now) {
    check_inputs();

    LogUtils::info("Generating SQLCMD script from {} (script: {}, generated at {})",
                   config_.input.file_path, config_.script_path,
                   TimestampUtils::format_readable(now, config_.layout.utc_timestamps));

    const std::string csv_text = CSVReader::load_file(config_.input.file_path);
    const auto records = generator_.read_records(csv_text);

    GenerationResult result;
    result.record_count = records.size();
    // sqlcmd resolves :r against its own working directory, not the CSV's
    const std::string script_path = std::filesystem::absolute(config_.script_path).lexically_normal().string();
    result.document = generator_.generate_document(records,
                                                   script_path,
                                                   config_.credentials.user,
                                                   config_.credentials.password,
                                                   now);

    if (config_.output.to_stdout) {
        *out_ << result.document.content;
        out_->flush();
        if (!*out_) {
            throw std::runtime_error("Failed to write generated script to stdout");
        }
    } else {
        result.output_path = writer_.write(result.document, config_.input.file_path);
    }

    LogUtils::info("Generated {} execution blocks", result.record_count);
    return result;
}
