#pragma once

#include "config.hpp"
#include "device/device_selector.hpp"
#include "format/format.hpp"
#include "platform/cuda_probe.hpp"
#include "segment.hpp"
#include "storage/history_db.hpp"
#include "whisper/backend.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

enum class RunErrorKind { Configuration, Input, Inference, Output };

std::string_view run_error_kind_name(RunErrorKind kind);

struct RunError {
    RunErrorKind kind;
    std::string message;
};

struct RunResult {
    std::filesystem::path output_dir;
    std::vector<std::pair<Format, std::filesystem::path>> files;
    std::vector<Segment> segments;
    std::string language;
    std::string model;
    Device device = Device::Cpu;
    bool device_fallback = false;
    std::vector<std::string> warnings;
};

// Runs one audio file through device resolution, inference and every
// requested encoder. Runs are sequential and share no state beyond the
// output root on disk.
class TranscriptionOrchestrator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    TranscriptionOrchestrator(Config config, bool verbose,
                              const CudaProbe& probe, BackendLoader loader,
                              HistoryDb* history = nullptr,
                              Clock clock = [] { return std::chrono::system_clock::now(); });

    TranscriptionOrchestrator(const TranscriptionOrchestrator&) = delete;
    TranscriptionOrchestrator& operator=(const TranscriptionOrchestrator&) = delete;

    std::expected<RunResult, RunError> run(const std::string& audio_path);

    const Config& config() const { return config_; }

private:
    std::expected<Transcript, std::string> infer(Device device, const InferenceRequest& request);

    void warn(RunResult& result, std::string msg);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    const CudaProbe& probe_;
    BackendLoader loader_;
    HistoryDb* history_;
    Clock clock_;
};
