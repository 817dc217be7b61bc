#pragma once

#include "GeneratorConfig.hpp"
#include "LogUtils.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>


// The output: section carries both file placement and script layout
struct OutputSection {
    OutputConfig output;
    ScriptLayout layout;
};


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        if (!node.IsMap()) {
            throw std::runtime_error("Configuration section '" + context + "' must be a map");
        }
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw std::runtime_error("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    template<>
    struct convert<RowSourceConfig> {
        static bool decode(const Node& node, RowSourceConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "csv", "delimiter", "trim_values"
            };
            check_unknown_keys(node, valid_keys, "input");

            if (node["csv"]) {
                rhs.file_path = node["csv"].as<std::string>();
            }
            if (node["delimiter"]) {
                rhs.delimiter = node["delimiter"].as<std::string>();
                rhs.delimiter_char();
            }
            if (node["trim_values"]) {
                rhs.trim_values = node["trim_values"].as<bool>();
            }
            return true;
        }
    };

    template<>
    struct convert<CredentialConfig> {
        static bool decode(const Node& node, CredentialConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "user", "password"
            };
            check_unknown_keys(node, valid_keys, "credentials");

            if (node["user"]) {
                rhs.user = node["user"].as<std::string>();
            }
            if (node["password"]) {
                rhs.password = node["password"].as<std::string>();
            }
            return true;
        }
    };

    template<>
    struct convert<OutputSection> {
        static bool decode(const Node& node, OutputSection& rhs) {
            static const std::set<std::string> valid_keys = {
                "dir", "stdout", "prefix", "extension", "banner", "line_ending", "utc"
            };
            check_unknown_keys(node, valid_keys, "output");

            if (node["dir"]) rhs.output.dir = node["dir"].as<std::string>();
            if (node["stdout"]) rhs.output.to_stdout = node["stdout"].as<bool>();
            if (node["prefix"]) rhs.layout.filename_prefix = node["prefix"].as<std::string>();
            if (node["extension"]) rhs.layout.filename_extension = node["extension"].as<std::string>();
            if (node["banner"]) rhs.layout.include_banner = node["banner"].as<bool>();
            if (node["line_ending"]) rhs.layout.line_ending = node["line_ending"].as<std::string>();
            if (node["utc"]) rhs.layout.utc_timestamps = node["utc"].as<bool>();

            rhs.layout.validate();
            return true;
        }
    };

    template<>
    struct convert<LogConfig> {
        static bool decode(const Node& node, LogConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "dir", "level", "verbose"
            };
            check_unknown_keys(node, valid_keys, "log");

            if (node["dir"]) {
                rhs.dir = node["dir"].as<std::string>();
            }
            if (node["level"]) {
                rhs.level = node["level"].as<std::string>();
                LogUtils::parse_level(rhs.level);
            }
            if (node["verbose"]) {
                rhs.verbose = node["verbose"].as<bool>();
            }
            return true;
        }
    };

}
