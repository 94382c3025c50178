#include "orchestrator.hpp"

#include "output/output_directory.hpp"

#include <format>
#include <fstream>
#include <print>

namespace fs = std::filesystem;

std::string_view run_error_kind_name(RunErrorKind kind) {
    switch (kind) {
        case RunErrorKind::Configuration: return "configuration error";
        case RunErrorKind::Input: return "input error";
        case RunErrorKind::Inference: return "inference failure";
        case RunErrorKind::Output: return "output error";
    }
    return "error";
}

TranscriptionOrchestrator::TranscriptionOrchestrator(Config config, bool verbose,
                                                     const CudaProbe& probe, BackendLoader loader,
                                                     HistoryDb* history, Clock clock)
    : config_(std::move(config)), verbose_(verbose),
      probe_(probe), loader_(std::move(loader)),
      history_(history), clock_(std::move(clock)) {}

std::expected<RunResult, RunError> TranscriptionOrchestrator::run(const std::string& audio_path) {
    RunResult result;
    result.model = config_.transcription.model;

    auto selection = select_formats(config_.output.formats);
    for (const auto& id : selection.rejected) {
        warn(result, std::format("unsupported output format '{}', skipping", id));
    }
    if (selection.formats.empty()) {
        return std::unexpected(RunError{
            RunErrorKind::Configuration,
            "No valid formats selected. Supported: " + supported_formats_list(),
        });
    }

    auto task = parse_task(config_.transcription.task);
    if (!task) {
        return std::unexpected(RunError{
            RunErrorKind::Configuration,
            std::format("unknown task '{}' (expected transcribe or translate)",
                        config_.transcription.task),
        });
    }

    std::error_code ec;
    if (!fs::is_regular_file(audio_path, ec) || !std::ifstream(audio_path).is_open()) {
        return std::unexpected(RunError{
            RunErrorKind::Input,
            std::format("Audio file '{}' not found.", audio_path),
        });
    }

    // Resolved once per run, immediately before the model is loaded.
    DeviceSelector selector(probe_);
    auto resolution = selector.resolve(config_.transcription.device);
    result.device = resolution.device;
    if (resolution.fallback_occurred) {
        result.device_fallback = true;
        warn(result, resolution.reason.value_or("falling back to CPU"));
    }

    InferenceRequest request{
        .audio_path = audio_path,
        .language = config_.language_code(),
        .task = *task,
    };

    auto transcript = infer(result.device, request);
    if (!transcript && result.device == Device::Cuda) {
        warn(result, std::format("failed on CUDA: {}; falling back to CPU",
                                 transcript.error().substr(0, 100)));
        result.device = Device::Cpu;
        result.device_fallback = true;
        transcript = infer(result.device, request);
    }
    if (!transcript) {
        return std::unexpected(RunError{RunErrorKind::Inference, transcript.error()});
    }

    result.segments = std::move(transcript->segments);
    result.language = std::move(transcript->language);
    log(std::format("Transcribed {} segments", result.segments.size()));

    OutputDirectoryManager outputs(config_.output.root);
    auto batch = outputs.create_batch(OutputDirectoryManager::run_stamp(clock_()),
                                      audio_path, selection.formats);
    if (!batch) {
        return std::unexpected(RunError{RunErrorKind::Output, batch.error()});
    }
    result.output_dir = batch->directory;

    for (const auto& [format, path] : batch->files) {
        auto written = OutputDirectoryManager::write_file(path, encode(format, result.segments));
        if (!written) {
            return std::unexpected(RunError{RunErrorKind::Output, written.error()});
        }
        result.files.emplace_back(format, path);
        log(std::format("Saved {} to {}", format_name(format), path.string()));
    }

    if (history_ && history_->is_open()) {
        std::string formats;
        for (const auto& [format, path] : result.files) {
            if (!formats.empty()) formats += ',';
            formats += format_name(format);
        }
        bool recorded = history_->insert(RunRecord{
            .audio_path = audio_path,
            .model = result.model,
            .language = result.language,
            .task = std::string(task_name(*task)),
            .device = std::string(device_name(result.device)),
            .device_fallback = result.device_fallback,
            .segment_count = static_cast<int64_t>(result.segments.size()),
            .output_dir = result.output_dir.string(),
            .formats = formats,
        });
        if (!recorded) log("Run not recorded in history");
    }

    return result;
}

std::expected<Transcript, std::string>
TranscriptionOrchestrator::infer(Device device, const InferenceRequest& request) {
    log(std::format("Loading model '{}' on {}...", config_.transcription.model, device_name(device)));
    auto backend = loader_(config_.transcription.model, device);
    if (!backend) {
        return std::unexpected("model load failed: " + backend.error());
    }
    if (!*backend) {
        return std::unexpected("model load failed: loader returned no model");
    }

    log("Starting transcription...");
    return (*backend)->transcribe(request);
}

void TranscriptionOrchestrator::warn(RunResult& result, std::string msg) {
    std::println(stderr, "[whisper-export] warning: {}", msg);
    result.warnings.push_back(std::move(msg));
}

void TranscriptionOrchestrator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[whisper-export] {}", msg);
    }
}
