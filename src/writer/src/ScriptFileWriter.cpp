#include "ScriptFileWriter.hpp"
#include "LogUtils.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <system_error>


ScriptFileWriter::ScriptFileWriter(const OutputConfig& config)
    : config_(config) {}

std::filesystem::path ScriptFileWriter::output_directory(const std::filesystem::path& csv_path) const {
    if (!config_.dir.empty()) {
        return std::filesystem::path(config_.dir);
    }

    std::filesystem::path parent = csv_path.parent_path();
    if (parent.empty()) {
        parent = std::filesystem::current_path();
    }
    return parent;
}

std::filesystem::path ScriptFileWriter::candidate_path(const std::filesystem::path& directory,
                                                       const std::string& suggested_filename,
                                                       int suffix) {
    if (suffix == 0) {
        return directory / suggested_filename;
    }

    // '_' sorts after '.', so suffixed names stay between this second and the next
    const std::string stem = std::filesystem::path(suggested_filename).stem().string();
    const std::string extension = std::filesystem::path(suggested_filename).extension().string();
    return directory / fmt::format("{}_{:02}{}", stem, suffix, extension);
}

std::filesystem::path ScriptFileWriter::write(const GeneratedDocument& document,
                                              const std::filesystem::path& csv_path) const {
    const std::filesystem::path directory = output_directory(csv_path);

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("Failed to create output directory " + directory.string() + ": " + ec.message());
    }

    for (int suffix = 0; suffix <= MAX_COLLISION_SUFFIX; ++suffix) {
        const std::filesystem::path target = candidate_path(directory, document.suggested_filename, suffix);

        // "x" fails with EEXIST instead of truncating a file another run created
        errno = 0;
        std::FILE* file = std::fopen(target.string().c_str(), "wbx");
        if (file == nullptr) {
            if (errno == EEXIST) {
                LogUtils::debug("{} already exists, trying the next name", target.filename().string());
                continue;
            }
            throw std::runtime_error("Failed to open output file " + target.string() + ": " + std::strerror(errno));
        }

        const size_t written = std::fwrite(document.content.data(), 1, document.content.size(), file);
        const bool write_failed = written != document.content.size() || std::ferror(file) != 0;
        if (std::fclose(file) != 0 || write_failed) {
            throw std::runtime_error("Failed to write output file: " + target.string());
        }

        LogUtils::info("Wrote {} bytes to {}", document.content.size(), target.string());
        return target;
    }

    throw std::runtime_error("Too many scripts generated within one second in " + directory.string()
                             + ": all names for " + document.suggested_filename + " are taken");
}
