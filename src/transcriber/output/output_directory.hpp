#pragma once

#include "format/format.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct OutputBatch {
    std::filesystem::path directory;
    std::vector<std::pair<Format, std::filesystem::path>> files;
};

// Places one run's output files under <root>/<YYYYMMDD_HHMMSS>/<base>.<ext>.
class OutputDirectoryManager {
public:
    explicit OutputDirectoryManager(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    // Local time, second precision: "20250131_235959".
    static std::string run_stamp(std::chrono::system_clock::time_point when);

    // Input file name without directories and without its last extension.
    static std::string output_basename(std::string_view input_path);

    static std::filesystem::path file_path(const std::filesystem::path& directory,
                                           std::string_view input_path, Format format);

    // Pure path derivation, touches nothing on disk.
    OutputBatch plan(std::string_view stamp, std::string_view input_path,
                     const std::vector<Format>& formats) const;

    // Like plan(), but picks a directory no earlier run has used (appending
    // _1, _2, ... to the stamp when needed) and creates it.
    std::expected<OutputBatch, std::string>
        create_batch(std::string_view stamp, std::string_view input_path,
                     const std::vector<Format>& formats) const;

    // Creates the directory and all missing parents; succeeds if it exists.
    static std::expected<void, std::string> ensure_directory(const std::filesystem::path& dir);

    // Writes to <path>.part and renames it into place.
    static std::expected<void, std::string> write_file(const std::filesystem::path& path,
                                                       std::string_view content);

private:
    std::filesystem::path root_;
};
