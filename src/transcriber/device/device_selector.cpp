#include "device/device_selector.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <format>
#include <print>

std::string_view device_name(Device device) {
    return device == Device::Cuda ? "cuda" : "cpu";
}

std::optional<DevicePreference> parse_device_preference(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "auto" || lower.empty()) return DevicePreference::Auto;
    if (lower == "cuda") return DevicePreference::Cuda;
    if (lower == "cpu") return DevicePreference::Cpu;
    return std::nullopt;
}

DeviceSelector::DeviceSelector(const CudaProbe& probe) : probe_(probe) {}

std::expected<GpuInfo, std::string> DeviceSelector::probe_cuda() const {
    try {
        return probe_.probe();
    } catch (const std::exception& e) {
        return std::unexpected(std::format("CUDA probe failed: {}", e.what()));
    }
}

DeviceResolution DeviceSelector::resolve(DevicePreference preference) const {
    switch (preference) {
        case DevicePreference::Cpu:
            std::println(stderr, "device: using CPU (forced)");
            return {.device = Device::Cpu};

        case DevicePreference::Cuda: {
            auto gpu = probe_cuda();
            if (gpu) {
                std::println(stderr, "device: using CUDA GPU: {}", gpu->name);
                return {.device = Device::Cuda};
            }
            auto reason = std::format("requested device 'cuda' not available ({}), falling back to CPU",
                                      gpu.error());
            return {.device = Device::Cpu, .fallback_occurred = true, .reason = std::move(reason)};
        }

        case DevicePreference::Auto: {
            auto gpu = probe_cuda();
            if (gpu) {
                std::println(stderr, "device: CUDA GPU detected: {}", gpu->name);
                return {.device = Device::Cuda};
            }
            std::println(stderr, "device: using CPU ({})", gpu.error());
            return {.device = Device::Cpu};
        }
    }
    return {.device = Device::Cpu};
}

DeviceResolution DeviceSelector::resolve(std::string_view preference) const {
    if (auto pref = parse_device_preference(preference)) {
        return resolve(*pref);
    }
    auto reason = std::format("requested device '{}' not available, falling back to CPU", preference);
    return {.device = Device::Cpu, .fallback_occurred = true, .reason = std::move(reason)};
}
