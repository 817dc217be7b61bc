#pragma once

#include "ConfigParser.hpp"
#include "GeneratorConfig.hpp"

#include <unordered_map>
#include <vector>
#include <string>


class ParameterContext {
public:
    ParameterContext();

    // Returns false when the run should stop without generating (--help, --version)
    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);

    const GeneratorConfig& get_config() const;

    // Level implied by log.level and --verbose
    LogUtils::Level get_log_level() const;

private:
    GeneratorConfig config_;

    std::unordered_map<std::string, std::string> cli_params;

    YAML::Node load_config(const std::string& file_path);
    void validate() const;

private:
    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--csv")
        char short_opt;          // Short option (e.g. 'i')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
