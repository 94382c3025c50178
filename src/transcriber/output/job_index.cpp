#include "output/job_index.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <print>
#include <sstream>

namespace fs = std::filesystem;

namespace {

bool all_digits(std::string_view s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

int to_int(std::string_view s) {
    int v = 0;
    for (char c : s) v = v * 10 + (c - '0');
    return v;
}

// Orders "<stamp>_<N>" folders by stamp, then by N as a number.
bool more_recent(const std::string& a, const std::string& b) {
    auto stamp_a = std::string_view(a).substr(0, 15);
    auto stamp_b = std::string_view(b).substr(0, 15);
    if (stamp_a != stamp_b) return stamp_a > stamp_b;

    auto suffix = [](std::string_view folder) {
        return folder.size() > 16 ? to_int(folder.substr(16)) : 0;
    };
    return suffix(a) > suffix(b);
}

} // namespace

JobIndex::JobIndex(fs::path root) : root_(std::move(root)) {}

std::optional<std::string> JobIndex::parse_stamp(const std::string& folder) {
    std::string_view s = folder;
    if (s.size() < 15 || s[8] != '_') return std::nullopt;

    auto date = s.substr(0, 8);
    auto time = s.substr(9, 6);
    if (!all_digits(date) || !all_digits(time)) return std::nullopt;
    if (s.size() > 15 && (s[15] != '_' || s.size() > 25 || !all_digits(s.substr(16)))) {
        return std::nullopt;
    }

    int year = to_int(date.substr(0, 4));
    int month = to_int(date.substr(4, 2));
    int day = to_int(date.substr(6, 2));
    int hour = to_int(time.substr(0, 2));
    int minute = to_int(time.substr(2, 2));
    int second = to_int(time.substr(4, 2));

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    return std::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}",
                       year, month, day, hour, minute, second);
}

std::vector<JobSummary> JobIndex::list() const {
    std::vector<JobSummary> jobs;

    std::error_code ec;
    for (auto& entry : fs::directory_iterator(root_, ec)) {
        if (!entry.is_directory(ec)) continue;

        auto folder = entry.path().filename().string();
        auto display = parse_stamp(folder);
        if (!display) continue;

        JobSummary job{.folder = folder, .display_time = *display};
        std::vector<std::string> names;
        for (auto& file : fs::directory_iterator(entry.path(), ec)) {
            if (!file.is_regular_file(ec)) continue;
            if (file.path().extension() == ".zip" || file.path().extension() == ".part") continue;
            names.push_back(file.path().filename().string());
        }
        if (names.empty()) continue;

        std::sort(names.begin(), names.end());
        job.base_name = fs::path(names.front()).stem().string();
        job.file_count = names.size();
        jobs.push_back(std::move(job));
    }

    std::sort(jobs.begin(), jobs.end(), [](const JobSummary& a, const JobSummary& b) {
        return more_recent(a.folder, b.folder);
    });
    return jobs;
}

std::expected<JobContents, std::string> JobIndex::load(const std::string& folder) const {
    if (!parse_stamp(folder)) {
        return std::unexpected("not a job folder: " + folder);
    }

    auto dir = root_ / folder;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::unexpected("job folder not found: " + folder);
    }

    fs::directory_iterator files(dir, ec);
    if (ec) {
        return std::unexpected(std::format("cannot list {}: {}", dir.string(), ec.message()));
    }

    JobContents job{.folder = folder};
    for (auto& file : files) {
        if (!file.is_regular_file(ec)) continue;

        auto ext = file.path().extension().string();
        if (ext.empty()) continue;
        auto format = parse_format(std::string_view(ext).substr(1));
        if (!format) continue;

        std::ifstream f(file.path(), std::ios::binary);
        if (!f.is_open()) {
            std::println(stderr, "jobs: cannot read {}", file.path().string());
            continue;
        }
        std::ostringstream ss;
        ss << f.rdbuf();
        job.files[*format] = ss.str();
    }
    return job;
}
