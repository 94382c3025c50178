#include "output/output_directory.hpp"

#include <ctime>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

OutputDirectoryManager::OutputDirectoryManager(fs::path root)
    : root_(std::move(root)) {}

std::string OutputDirectoryManager::run_stamp(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}

std::string OutputDirectoryManager::output_basename(std::string_view input_path) {
    return fs::path(input_path).stem().string();
}

fs::path OutputDirectoryManager::file_path(const fs::path& directory,
                                           std::string_view input_path, Format format) {
    return directory / std::format("{}.{}", output_basename(input_path), format_name(format));
}

OutputBatch OutputDirectoryManager::plan(std::string_view stamp, std::string_view input_path,
                                         const std::vector<Format>& formats) const {
    OutputBatch batch;
    batch.directory = root_ / stamp;
    for (auto f : formats) {
        batch.files.emplace_back(f, file_path(batch.directory, input_path, f));
    }
    return batch;
}

std::expected<OutputBatch, std::string>
OutputDirectoryManager::create_batch(std::string_view stamp, std::string_view input_path,
                                     const std::vector<Format>& formats) const {
    if (auto res = ensure_directory(root_); !res) {
        return std::unexpected(res.error());
    }

    std::string name(stamp);
    for (int suffix = 1;; ++suffix) {
        std::error_code ec;
        // create_directory reports false when the path already exists, which
        // makes the claim atomic with respect to other runs.
        if (fs::create_directory(root_ / name, ec)) break;
        if (ec) {
            return std::unexpected(std::format("cannot create {}: {}",
                                               (root_ / name).string(), ec.message()));
        }
        name = std::format("{}_{}", stamp, suffix);
    }

    return plan(name, input_path, formats);
}

std::expected<void, std::string> OutputDirectoryManager::ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(std::format("cannot create {}: {}", dir.string(), ec.message()));
    }
    if (!fs::is_directory(dir, ec)) {
        return std::unexpected(std::format("{} is not a directory", dir.string()));
    }
    return {};
}

std::expected<void, std::string> OutputDirectoryManager::write_file(const fs::path& path,
                                                                    std::string_view content) {
    auto part = path;
    part += ".part";

    {
        std::ofstream f(part, std::ios::binary | std::ios::trunc);
        if (!f.is_open()) {
            return std::unexpected(std::format("cannot open {} for writing", part.string()));
        }
        f.write(content.data(), static_cast<std::streamsize>(content.size()));
        f.flush();
        if (!f) {
            std::error_code ignored;
            fs::remove(part, ignored);
            return std::unexpected(std::format("write to {} failed", part.string()));
        }
    }

    std::error_code ec;
    fs::rename(part, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(part, ignored);
        return std::unexpected(std::format("cannot move {} into place: {}",
                                           path.string(), ec.message()));
    }
    return {};
}
