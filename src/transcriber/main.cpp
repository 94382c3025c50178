#include "config.hpp"
#include "orchestrator.hpp"
#include "output/job_index.hpp"
#include "platform/linux/nvidia_procfs_probe.hpp"
#include "platform/platform_paths.hpp"
#include "storage/history_db.hpp"
#include "strings.hpp"
#include "whisper/lan_backend.hpp"

#include <cstdlib>
#include <print>
#include <string>

static void usage(const char* prog) {
    std::println("Usage: {} [options] [<audio-file>]", prog);
    std::println("       {} --jobs | --show FOLDER | --history [N]", prog);
    std::println("Options:");
    std::println("  -a, --audio PATH        Audio file (default: $WHISPER_AUDIO)");
    std::println("  -m, --model NAME        Whisper model (default: small.en)");
    std::println("  -l, --language LANG     Language code or name, 'auto' to detect");
    std::println("  -t, --task TASK         transcribe or translate");
    std::println("  -f, --formats LIST      Comma separated: {}", supported_formats_list());
    std::println("  -d, --device DEVICE     auto, cuda or cpu");
    std::println("  -o, --output-dir DIR    Output root (default: outputs)");
    std::println("  -c, --config PATH       Config file path");
    std::println("  -v, --verbose           Enable verbose logging");
    std::println("      --jobs              List previous jobs in the output root");
    std::println("      --show FOLDER       Print the outputs of a previous job");
    std::println("      --history [N]       Show the N most recent runs");
    std::println("  -h, --help              Show this help");
}

static int list_jobs(const Config& config) {
    auto jobs = JobIndex(config.output.root).list();
    if (jobs.empty()) {
        std::println("No previous transcription jobs found");
        return 0;
    }
    for (const auto& job : jobs) {
        std::println("{} | {} | {} files | {}", job.display_time, job.base_name,
                     job.file_count, job.folder);
    }
    return 0;
}

static int show_job(const Config& config, const std::string& folder) {
    auto job = JobIndex(config.output.root).load(folder);
    if (!job) {
        std::println(stderr, "Error: {}", job.error());
        return 1;
    }
    for (const auto& [format, content] : job->files) {
        std::println("==> {} <==", format_name(format));
        std::print("{}", content);
    }
    return 0;
}

static int show_history(int limit) {
    HistoryDb db;
    if (!db.open(platform::history_db_path())) return 1;

    for (const auto& e : db.recent(limit)) {
        std::println("[{}] {} -> {}", e.timestamp, e.run.audio_path, e.run.output_dir);
        std::println("  {} {} on {}{}, {} segments, language {}, formats {}",
                     e.run.model, e.run.task, e.run.device,
                     e.run.device_fallback ? " (fallback)" : "",
                     e.run.segment_count,
                     e.run.language.empty() ? "unknown" : e.run.language, e.run.formats);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string audio_path;
    std::string show_folder;
    bool jobs = false;
    int history_limit = 0;

    std::string model, language, task, formats, device, output_dir;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 < argc) {
                out = argv[++i];
                return true;
            }
            std::println(stderr, "Missing value for {}", arg);
            return false;
        };

        bool ok = true;
        if (arg == "--audio" || arg == "-a") {
            ok = value(audio_path);
        } else if (arg == "--model" || arg == "-m") {
            ok = value(model);
        } else if (arg == "--language" || arg == "-l") {
            ok = value(language);
        } else if (arg == "--task" || arg == "-t") {
            ok = value(task);
        } else if (arg == "--formats" || arg == "-f") {
            ok = value(formats);
        } else if (arg == "--device" || arg == "-d") {
            ok = value(device);
        } else if (arg == "--output-dir" || arg == "-o") {
            ok = value(output_dir);
        } else if (arg == "--config" || arg == "-c") {
            ok = value(config_path);
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--jobs") {
            jobs = true;
        } else if (arg == "--show") {
            ok = value(show_folder);
        } else if (arg == "--history") {
            history_limit = 10;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                history_limit = std::atoi(argv[++i]);
            }
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::println(stderr, "Unknown option: {}", arg);
            ok = false;
        } else {
            audio_path = arg;
        }

        if (!ok) {
            usage(argv[0]);
            return 1;
        }
    }

    // Load config, then layer environment and flags on top.
    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    config.apply_env([](const char* name) { return std::getenv(name); });

    if (!model.empty()) config.transcription.model = model;
    if (!language.empty()) config.transcription.language = language;
    if (!task.empty()) config.transcription.task = task;
    if (!device.empty()) config.transcription.device = device;
    if (!formats.empty()) config.output.formats = split_list(formats);
    if (!output_dir.empty()) config.output.root = output_dir;
    if (!audio_path.empty()) config.input.audio_path = audio_path;

    if (jobs) return list_jobs(config);
    if (!show_folder.empty()) return show_job(config, show_folder);
    if (history_limit > 0) return show_history(history_limit);

    audio_path = config.input.audio_path;
    if (audio_path.empty()) {
        usage(argv[0]);
        return 1;
    }

    if (config.backend.type != "lan") {
        std::println(stderr, "Unknown backend type: {}", config.backend.type);
        return 1;
    }

    HistoryDb history;
    if (!history.open(platform::history_db_path())) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    NvidiaProcfsProbe probe;
    auto loader = LanBackend::loader(config.backend.url, config.backend.api_format);

    if (verbose) {
        std::println(stderr, "[whisper-export] Starting (backend: {} @ {})",
                     config.backend.type, config.backend.url);
    }

    TranscriptionOrchestrator orchestrator(std::move(config), verbose, probe,
                                           std::move(loader), &history);
    auto result = orchestrator.run(audio_path);
    if (!result) {
        std::println(stderr, "Error ({}): {}", run_error_kind_name(result.error().kind),
                     result.error().message);
        return 1;
    }

    for (const auto& [format, path] : result->files) {
        std::println("Saved {} to {}", format_name(format), path.string());
    }
    std::println("Transcription completed! Output saved to: {}", result->output_dir.string());
    return 0;
}
