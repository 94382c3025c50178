#pragma once

#include "format/format.hpp"

#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct JobSummary {
    std::string folder;       // "20250131_235959" or "20250131_235959_1"
    std::string display_time; // "2025-01-31 23:59:59"
    std::string base_name;    // input file name without extension
    size_t file_count = 0;
};

struct JobContents {
    std::string folder;
    std::map<Format, std::string> files;
};

// Browses the run directories under an output root.
class JobIndex {
public:
    explicit JobIndex(std::filesystem::path root);

    // Most recent first. Folders that are not run stamps, or hold no output
    // files, are skipped.
    std::vector<JobSummary> list() const;

    std::expected<JobContents, std::string> load(const std::string& folder) const;

    // "YYYYMMDD_HHMMSS[_N]" -> "YYYY-MM-DD HH:MM:SS"
    static std::optional<std::string> parse_stamp(const std::string& folder);

private:
    std::filesystem::path root_;
};
