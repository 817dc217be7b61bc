#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "GenerationJob.hpp"
#include "GeneratorErrors.hpp"
#include <filesystem>
#include <iostream>

int main(int argc, char* argv[]) {
    int result = 0;

    // 1. Parse parameters; the logger is not up yet, messages go to stderr
    ParameterContext context;
    try {
        if (!context.init(argc, argv)) {
            return 0;
        }
    } catch (const std::exception& e) {
        LogUtils::error("Error: " + std::string(e.what()));
        LogUtils::error("Use --help or -? to show usage information");
        return 1;
    }

    const GeneratorConfig& config = context.get_config();

    LogUtils::Options log_options;
    log_options.level = context.get_log_level();
    log_options.log_file = (std::filesystem::path(config.log.dir) / "sqlcmdgen.log").string();
    log_options.console_to_stderr = config.output.to_stdout;

    try {
        LogUtils::init(log_options);
    } catch (const std::exception& e) {
        LogUtils::error("Failed to initialize logging in " + config.log.dir + ": " + e.what());
        return 1;
    }

    // 2. Generate
    try {
        GenerationJob job(config);
        GenerationResult generated = job.run();

        if (generated.output_path) {
            LogUtils::info("SQLCMD script generated: {}", generated.output_path->string());
        }

    } catch (const FormatError& e) {
        LogUtils::error("Invalid CSV input: {}", e.what());
        result = 1;
    } catch (const EmptyInputError& e) {
        LogUtils::error("{}", e.what());
        result = 1;
    } catch (const std::exception& e) {
        LogUtils::error("Error during generation: " + std::string(e.what()));
        result = 1;
    }

    LogUtils::shutdown();
    return result;
}
