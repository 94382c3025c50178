#include <catch2/catch_test_macros.hpp>

#include "orchestrator.hpp"
#include "output/output_directory.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

class StaticCudaProbe : public CudaProbe {
public:
    explicit StaticCudaProbe(bool available) : available_(available) {}

    std::expected<GpuInfo, std::string> probe() const override {
        if (available_) return GpuInfo{.name = "Test GPU", .count = 1};
        return std::unexpected("no CUDA GPU detected");
    }

private:
    bool available_;
};

class MockBackend : public WhisperBackend {
public:
    MockBackend(std::vector<Segment> segments, std::vector<InferenceRequest>& seen)
        : segments_(std::move(segments)), seen_(seen) {}

    std::expected<Transcript, std::string> transcribe(const InferenceRequest& request) override {
        seen_.push_back(request);
        return Transcript{.segments = segments_, .language = "en"};
    }

private:
    std::vector<Segment> segments_;
    std::vector<InferenceRequest>& seen_;
};

// Records every load and fails loads on the devices it is told to.
struct FakeLoader {
    std::vector<Segment> segments = {
        {0.0, 4.0, "Hello."},
        {4.0, 8.5, "World."},
    };
    bool fail_cuda = false;
    bool fail_cpu = false;
    std::vector<Device> loads;
    std::vector<InferenceRequest> requests;

    BackendLoader loader() {
        return [this](const std::string&, Device device)
            -> std::expected<std::unique_ptr<WhisperBackend>, std::string> {
            loads.push_back(device);
            if ((device == Device::Cuda && fail_cuda) || (device == Device::Cpu && fail_cpu)) {
                return std::unexpected("out of memory");
            }
            return std::make_unique<MockBackend>(segments, requests);
        };
    }
};

struct TmpDir {
    fs::path path;

    TmpDir() {
        path = fs::temp_directory_path() / ("we_test_run_" + std::to_string(getpid()));
        fs::remove_all(path);
        fs::create_directories(path);
    }

    ~TmpDir() { fs::remove_all(path); }
};

std::string read_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::chrono::system_clock::time_point fixed_time() {
    return std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000));
}

} // namespace

TEST_CASE("TranscriptionOrchestrator", "[orchestrator]") {
    TmpDir tmp;
    auto audio = tmp.path / "meeting.wav";
    std::ofstream(audio) << "RIFF";

    Config config;
    config.output.root = (tmp.path / "outputs").string();
    config.output.formats = {"srt", "txt"};
    config.transcription.device = "cpu";

    FakeLoader fake;
    StaticCudaProbe no_gpu(false);
    StaticCudaProbe gpu(true);

    SECTION("WritesRequestedFormats") {
        config.output.formats = {"srt", "vtt", "tsv", "json", "txt"};
        TranscriptionOrchestrator orch(config, false, no_gpu, fake.loader(), nullptr, fixed_time);

        auto result = orch.run(audio.string());
        REQUIRE(result.has_value());
        REQUIRE(result->files.size() == 5);
        REQUIRE(result->warnings.empty());
        REQUIRE(result->device == Device::Cpu);
        REQUIRE(result->language == "en");
        REQUIRE(result->output_dir.parent_path().string() == config.output.root);
        REQUIRE(result->output_dir.filename().string() ==
                OutputDirectoryManager::run_stamp(fixed_time()));

        REQUIRE(read_file(result->output_dir / "meeting.txt") == "Hello.\nWorld.\n");
        REQUIRE(read_file(result->output_dir / "meeting.tsv") ==
                "start\tend\tspeaker\ttext\n0.0\t4.0\t\tHello.\n4.0\t8.5\t\tWorld.\n");
        REQUIRE(read_file(result->output_dir / "meeting.srt").starts_with("1\n00:00:00,000 --> "));
        REQUIRE(fs::exists(result->output_dir / "meeting.vtt"));
        REQUIRE(fs::exists(result->output_dir / "meeting.json"));
    }

    SECTION("UnknownFormatIsSkippedWithOneWarning") {
        config.output.formats = {"srt", "bogus", "txt"};
        TranscriptionOrchestrator orch(config, false, no_gpu, fake.loader(), nullptr, fixed_time);

        auto result = orch.run(audio.string());
        REQUIRE(result.has_value());
        REQUIRE(result->warnings.size() == 1);
        REQUIRE(result->warnings[0].find("bogus") != std::string::npos);
        REQUIRE(result->files.size() == 2);
        REQUIRE(fs::exists(result->output_dir / "meeting.srt"));
        REQUIRE(fs::exists(result->output_dir / "meeting.txt"));
        REQUIRE_FALSE(fs::exists(result->output_dir / "meeting.bogus"));
    }

    SECTION("NoValidFormatsIsConfigurationError") {
        config.output.formats = {"bogus"};
        TranscriptionOrchestrator orch(config, false, no_gpu, fake.loader(), nullptr, fixed_time);

        auto result = orch.run(audio.string());
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == RunErrorKind::Configuration);
        REQUIRE(fake.loads.empty());
    }

    SECTION("UnknownTaskIsConfigurationError") {
        config.transcription.task = "summarize";
        TranscriptionOrchestrator orch(config, false, no_gpu, fake.loader(), nullptr, fixed_time);

        auto result = orch.run(audio.string());
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == RunErrorKind::Configuration);
    }

    SECTION("MissingInputAbortsBeforeAnyWork") {
        TranscriptionOrchestrator orch(config, false, no_gpu, fake.loader(), nullptr, fixed_time);

        auto result = orch.run((tmp.path / "missing.wav").string());
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == RunErrorKind::Input);
        REQUIRE(fake.loads.empty());
        REQUIRE_FALSE(fs::exists(config.output.root));
    }

    SECTION("DirectoryAsInputIsInputError") {
        fs::create_directories(tmp.path / "folder.wav");
        TranscriptionOrchestrator orch(config, false, no_gpu, fake.loader(), nullptr, fixed_time);

        auto result = orch.run((tmp.path / "folder.wav").string());
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == RunErrorKind::Input);
        REQUIRE(fake.loads.empty());
    }

    SECTION("UnreadableInputIsInputError") {
        // Permission bits do not restrict root.
        if (geteuid() != 0) {
            auto locked = tmp.path / "locked.wav";
            std::ofstream(locked) << "RIFF";
            fs::permissions(locked, fs::perms::none);
            TranscriptionOrchestrator orch(config, false, no_gpu, fake.loader(), nullptr, fixed_time);

            auto result = orch.run(locked.string());
            fs::permissions(locked, fs::perms::owner_all);
            REQUIRE_FALSE(result.has_value());
            REQUIRE(result.error().kind == RunErrorKind::Input);
            REQUIRE(fake.loads.empty());
            REQUIRE_FALSE(fs::exists(config.output.root));
        }
    }

    SECTION("WriteFailureMidBatchIsOutputError") {
        // 246 characters leave room for "<base>.srt.part" but not for
        // "<base>.json.part" within the 255 byte file name limit.
        auto long_audio = tmp.path / (std::string(246, 'a') + ".wav");
        std::ofstream(long_audio) << "RIFF";
        config.output.formats = {"srt", "json"};
        TranscriptionOrchestrator orch(config, false, no_gpu, fake.loader(), nullptr, fixed_time);

        auto result = orch.run(long_audio.string());
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == RunErrorKind::Output);

        auto batch_dir = fs::path(config.output.root) / OutputDirectoryManager::run_stamp(fixed_time());
        auto base = std::string(246, 'a');
        REQUIRE(fs::exists(batch_dir / (base + ".srt")));
        size_t entries = 0;
        for (auto& entry : fs::directory_iterator(batch_dir)) {
            REQUIRE(entry.path().extension().string() == ".srt");
            ++entries;
        }
        REQUIRE(entries == 1);
    }

    SECTION("CudaRequestedButUnavailable") {
        config.transcription.device = "cuda";
        TranscriptionOrchestrator orch(config, false, no_gpu, fake.loader(), nullptr, fixed_time);

        auto result = orch.run(audio.string());
        REQUIRE(result.has_value());
        REQUIRE(result->device == Device::Cpu);
        REQUIRE(result->device_fallback);
        REQUIRE(result->warnings.size() == 1);
        REQUIRE(fake.loads == std::vector<Device>{Device::Cpu});
    }

    SECTION("CudaLoadFailureRetriesOnCpuOnce") {
        config.transcription.device = "auto";
        fake.fail_cuda = true;
        TranscriptionOrchestrator orch(config, false, gpu, fake.loader(), nullptr, fixed_time);

        auto result = orch.run(audio.string());
        REQUIRE(result.has_value());
        REQUIRE(fake.loads == std::vector<Device>{Device::Cuda, Device::Cpu});
        REQUIRE(result->device == Device::Cpu);
        REQUIRE(result->device_fallback);
        REQUIRE(fake.requests.size() == 1);
    }

    SECTION("SecondFailureIsFatalAndWritesNothing") {
        config.transcription.device = "cuda";
        fake.fail_cuda = true;
        fake.fail_cpu = true;
        TranscriptionOrchestrator orch(config, false, gpu, fake.loader(), nullptr, fixed_time);

        auto result = orch.run(audio.string());
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == RunErrorKind::Inference);
        REQUIRE(fake.loads.size() == 2);
        REQUIRE_FALSE(fs::exists(config.output.root));
    }

    SECTION("CpuFailureDoesNotRetry") {
        fake.fail_cpu = true;
        TranscriptionOrchestrator orch(config, false, gpu, fake.loader(), nullptr, fixed_time);

        auto result = orch.run(audio.string());
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == RunErrorKind::Inference);
        REQUIRE(fake.loads == std::vector<Device>{Device::Cpu});
    }

    SECTION("RequestCarriesLanguageAndTask") {
        config.transcription.language = "German";
        config.transcription.task = "translate";
        config.languages = {{"German", "de"}};
        TranscriptionOrchestrator orch(config, false, no_gpu, fake.loader(), nullptr, fixed_time);

        REQUIRE(orch.run(audio.string()).has_value());
        REQUIRE(fake.requests.size() == 1);
        REQUIRE(fake.requests[0].language == std::optional<std::string>("de"));
        REQUIRE(fake.requests[0].task == Task::Translate);
        REQUIRE(fake.requests[0].audio_path == audio.string());
    }

    SECTION("RunsInSameSecondGetSeparateDirectories") {
        TranscriptionOrchestrator orch(config, false, no_gpu, fake.loader(), nullptr, fixed_time);

        auto first = orch.run(audio.string());
        auto second = orch.run(audio.string());
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(first->output_dir.string() != second->output_dir.string());
    }

    SECTION("EmptyTranscriptStillWritesDocuments") {
        fake.segments.clear();
        config.output.formats = {"vtt", "json", "txt"};
        TranscriptionOrchestrator orch(config, false, no_gpu, fake.loader(), nullptr, fixed_time);

        auto result = orch.run(audio.string());
        REQUIRE(result.has_value());
        REQUIRE(read_file(result->output_dir / "meeting.vtt") == "WEBVTT\n\n");
        REQUIRE(read_file(result->output_dir / "meeting.txt").empty());
    }

    SECTION("RecordsHistory") {
        HistoryDb db;
        REQUIRE(db.open((tmp.path / "history.db").string()));
        TranscriptionOrchestrator orch(config, false, no_gpu, fake.loader(), &db, fixed_time);

        auto result = orch.run(audio.string());
        REQUIRE(result.has_value());

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].run.audio_path == audio.string());
        REQUIRE(entries[0].run.device == "cpu");
        REQUIRE(entries[0].run.segment_count == 2);
        REQUIRE(entries[0].run.formats == "srt,txt");
    }
}
