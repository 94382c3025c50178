#include "platform/linux/nvidia_procfs_probe.hpp"

#include "strings.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

NvidiaProcfsProbe::NvidiaProcfsProbe()
    : NvidiaProcfsProbe("/dev", "/proc") {}

NvidiaProcfsProbe::NvidiaProcfsProbe(fs::path dev_root, fs::path proc_root)
    : dev_root_(std::move(dev_root)), proc_root_(std::move(proc_root)) {}

std::expected<GpuInfo, std::string> NvidiaProcfsProbe::probe() const {
    std::error_code ec;
    if (!fs::exists(dev_root_ / "nvidiactl", ec)) {
        return std::unexpected("NVIDIA driver not loaded");
    }

    std::vector<fs::path> gpus;
    for (auto& entry : fs::directory_iterator(proc_root_ / "driver/nvidia/gpus", ec)) {
        if (entry.is_directory(ec)) gpus.push_back(entry.path());
    }
    if (gpus.empty()) {
        return std::unexpected("no CUDA GPU detected");
    }
    std::sort(gpus.begin(), gpus.end());

    GpuInfo info;
    info.count = static_cast<int>(gpus.size());
    info.name = read_model(gpus.front() / "information");
    if (info.name.empty()) info.name = "NVIDIA GPU";
    return info;
}

std::string NvidiaProcfsProbe::read_model(const fs::path& information) {
    std::ifstream f(information);
    if (!f.is_open()) return {};

    std::string line;
    while (std::getline(f, line)) {
        if (line.starts_with("Model:")) {
            return trim(std::string_view(line).substr(6));
        }
    }
    return {};
}
