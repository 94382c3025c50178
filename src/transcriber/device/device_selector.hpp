#pragma once

#include "platform/cuda_probe.hpp"

#include <optional>
#include <string>
#include <string_view>

enum class Device { Cpu, Cuda };
enum class DevicePreference { Auto, Cuda, Cpu };

std::string_view device_name(Device device);
std::optional<DevicePreference> parse_device_preference(std::string_view name);

struct DeviceResolution {
    Device device = Device::Cpu;
    bool fallback_occurred = false;
    std::optional<std::string> reason; // set when fallback_occurred
};

// Resolves a device preference to a concrete device. CUDA being unavailable
// is a result, never an error; the caller reports a fallback.
class DeviceSelector {
public:
    explicit DeviceSelector(const CudaProbe& probe);

    DeviceResolution resolve(DevicePreference preference) const;
    // Unrecognized names resolve to cpu with a fallback report.
    DeviceResolution resolve(std::string_view preference) const;

private:
    std::expected<GpuInfo, std::string> probe_cuda() const;

    const CudaProbe& probe_;
};
