#pragma once

#include "platform/cuda_probe.hpp"

#include <filesystem>

// Detects the NVIDIA kernel driver through /dev and /proc/driver/nvidia.
class NvidiaProcfsProbe : public CudaProbe {
public:
    NvidiaProcfsProbe();
    // Alternate roots for testing against a fake tree.
    NvidiaProcfsProbe(std::filesystem::path dev_root, std::filesystem::path proc_root);

    std::expected<GpuInfo, std::string> probe() const override;

private:
    static std::string read_model(const std::filesystem::path& information);

    std::filesystem::path dev_root_;
    std::filesystem::path proc_root_;
};
