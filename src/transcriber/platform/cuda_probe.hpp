#pragma once

#include <expected>
#include <string>

struct GpuInfo {
    std::string name;
    int count = 0;
};

class CudaProbe {
public:
    virtual ~CudaProbe() = default;
    // Error carries the reason CUDA cannot be used.
    virtual std::expected<GpuInfo, std::string> probe() const = 0;
};
