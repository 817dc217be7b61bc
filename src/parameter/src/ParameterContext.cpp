#include "ParameterContext.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <utility>

#ifndef SQLCMDGEN_VERSION
#define SQLCMDGEN_VERSION "1.0.0"
#endif
#ifndef SQLCMDGEN_BUILD_GIT
#define SQLCMDGEN_BUILD_GIT "unknown"
#endif
#ifndef SQLCMDGEN_BUILD_TARGET
#define SQLCMDGEN_BUILD_TARGET "unknown"
#endif
#ifndef SQLCMDGEN_BUILD_DATE
#define SQLCMDGEN_BUILD_DATE "unknown"
#endif

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--csv", 'i', "CSV file with 'server' and 'database' columns", true},
    {"--script", 's', "SQL script to run against every database", true},
    {"--user", 'u', "SQL login bound to $(USERNAME)", true},
    {"--password", 'p', "Password bound to $(PASSWORD)", true},
    {"--output-dir", 'o', "Directory for the generated script (default: next to the CSV)", true},
    {"--config-file", 'c', "Specify config file path", true},
    {"--stdout", 'S', "Print the generated script instead of writing a file", false},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: sqlcmdgen [OPTIONS]...\n\n"
              << "Generate one SQLCMD-mode script that runs a SQL file on every\n"
              << "server/database pair listed in a CSV file.\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();
        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        std::cout << std::string(desc_offset - current_len, ' ') << opt.description << "\n";
    }

    std::cout << "\nEnvironment:\n"
              << "  SQLCMDGEN_USER, SQLCMDGEN_PASSWORD, SQLCMDGEN_OUTPUT_DIR\n"
              << "\nExamples:\n"
              << "  sqlcmdgen --csv=servers.csv --script=setup.sql -u alice -p secret\n"
              << "  sqlcmdgen -c sqlcmdgen.yaml --stdout\n\n";
}

void ParameterContext::show_version() {
    std::cout << "sqlcmdgen version: " << SQLCMDGEN_VERSION << std::endl;
    std::cout << "git: " << SQLCMDGEN_BUILD_GIT << std::endl;
    std::cout << "build: " << SQLCMDGEN_BUILD_TARGET << " " << SQLCMDGEN_BUILD_DATE << std::endl;
}

YAML::Node ParameterContext::load_config(const std::string& file_path) {
    try {
        return YAML::LoadFile(file_path);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Failed to open config file: " + file_path);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Failed to parse config file " + file_path + ": " + e.what());
    }
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    merge_yaml(load_config(file_path));
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    if (!config || config.IsNull()) {
        return;
    }

    static const std::set<std::string> valid_keys = {
        "input", "script", "credentials", "output", "log"
    };
    YAML::check_unknown_keys(config, valid_keys, "config");

    if (config["input"]) {
        config_.input = config["input"].as<RowSourceConfig>();
    }
    if (config["script"]) {
        config_.script_path = config["script"].as<std::string>();
    }
    if (config["credentials"]) {
        config_.credentials = config["credentials"].as<CredentialConfig>();
    }
    if (config["output"]) {
        auto section = config["output"].as<OutputSection>();
        config_.output = section.output;
        config_.layout = section.layout;
    }
    if (config["log"]) {
        config_.log = config["log"].as<LogConfig>();
    }
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + key);
            }

            if (it->requires_value) {
                if (pos == std::string::npos) {
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Option requires a value: " + key);
                    }
                    value = argv[++i];
                }
            } else if (pos != std::string::npos) {
                throw std::runtime_error("Option does not take a value: " + key);
            }

            cli_params[key] = value;
        }
        // Handle short option format (-k value)
        else if (arg.size() > 1 && arg[0] == '-') {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + arg);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    if (cli_params.count("--csv"))
        config_.input.file_path = cli_params["--csv"];

    if (cli_params.count("--script"))
        config_.script_path = cli_params["--script"];

    if (cli_params.count("--user"))
        config_.credentials.user = cli_params["--user"];

    if (cli_params.count("--password"))
        config_.credentials.password = cli_params["--password"];

    if (cli_params.count("--output-dir"))
        config_.output.dir = cli_params["--output-dir"];

    if (cli_params.count("--stdout"))
        config_.output.to_stdout = true;

    if (cli_params.count("--verbose"))
        config_.log.verbose = true;
}

void ParameterContext::merge_environment_vars() {
    const std::vector<std::pair<std::string, std::string*>> env_mappings = {
        {"SQLCMDGEN_USER", &config_.credentials.user},
        {"SQLCMDGEN_PASSWORD", &config_.credentials.password},
        {"SQLCMDGEN_OUTPUT_DIR", &config_.output.dir}
    };

    for (const auto& [env_var, target] : env_mappings) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value) {
            *target = env_value;
        }
    }
}

void ParameterContext::validate() const {
    config_.input.delimiter_char();
    config_.layout.validate();
    LogUtils::parse_level(config_.log.level);
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    if (cli_params.count("--config-file")) {
        merge_yaml(cli_params["--config-file"]);
    }
    merge_environment_vars();
    merge_commandline();

    validate();
    return true;
}

const GeneratorConfig& ParameterContext::get_config() const {
    return config_;
}

LogUtils::Level ParameterContext::get_log_level() const {
    if (config_.log.verbose) {
        return LogUtils::Level::Debug;
    }
    return LogUtils::parse_level(config_.log.level);
}
