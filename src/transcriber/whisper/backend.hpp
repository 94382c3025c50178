#pragma once

#include "device/device_selector.hpp"
#include "segment.hpp"

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class Task { Transcribe, Translate };

std::string_view task_name(Task task);
std::optional<Task> parse_task(std::string_view name);

struct InferenceRequest {
    std::string audio_path;
    std::optional<std::string> language; // nullopt: auto-detect
    Task task = Task::Transcribe;
};

struct Transcript {
    std::vector<Segment> segments;
    std::string language;
};

// A loaded model, bound to the device it was loaded on.
class WhisperBackend {
public:
    virtual ~WhisperBackend() = default;
    virtual std::expected<Transcript, std::string> transcribe(const InferenceRequest& request) = 0;
};

// Loads a model onto a device.
using BackendLoader = std::function<
    std::expected<std::unique_ptr<WhisperBackend>, std::string>(const std::string& model, Device device)>;
