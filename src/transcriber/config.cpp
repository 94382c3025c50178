#include "config.hpp"

#include "platform/platform_paths.hpp"
#include "strings.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::optional<std::string> Config::language_code() const {
    auto lang = trim(transcription.language);
    if (auto it = languages.find(lang); it != languages.end()) {
        lang = it->second;
    }
    if (lang.empty() || lang == "auto" || lang == "Auto Detect") {
        return std::nullopt;
    }
    return lang;
}

void Config::apply_env(const EnvLookup& getenv) {
    auto set = [&getenv](const char* name, std::string& field) {
        const char* v = getenv(name);
        if (v && *v) field = v;
    };

    set("WHISPER_MODEL", transcription.model);
    set("WHISPER_LANGUAGE", transcription.language);
    set("WHISPER_TASK", transcription.task);
    set("WHISPER_DEVICE", transcription.device);
    set("WHISPER_OUTPUT_DIR", output.root);
    set("WHISPER_AUDIO", input.audio_path);

    if (const char* v = getenv("WHISPER_FORMATS"); v && *v) {
        output.formats = split_list(v);
    }
    if (const char* v = getenv("WHISPER_LANGUAGES"); v && *v) {
        auto mapping = parse_language_mapping(v);
        if (mapping.empty()) {
            std::println(stderr, "config: no valid language mappings in WHISPER_LANGUAGES");
        } else {
            languages = std::move(mapping);
        }
    }
}

std::map<std::string, std::string> Config::parse_language_mapping(const std::string& s) {
    std::map<std::string, std::string> mapping;
    for (const auto& pair : split_list(s)) {
        auto colon = pair.find(':');
        if (colon == std::string::npos) continue;
        auto display = trim(std::string_view(pair).substr(0, colon));
        auto code = trim(std::string_view(pair).substr(colon + 1));
        if (!display.empty()) mapping[display] = code;
    }
    return mapping;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("type")) cfg.backend.type = b["type"].get<std::string>();
            if (b.contains("url")) cfg.backend.url = b["url"].get<std::string>();
            if (b.contains("api_format")) cfg.backend.api_format = b["api_format"].get<std::string>();
        }

        if (j.contains("transcription")) {
            auto& t = j["transcription"];
            if (t.contains("model")) cfg.transcription.model = t["model"].get<std::string>();
            if (t.contains("language")) cfg.transcription.language = t["language"].get<std::string>();
            if (t.contains("task")) cfg.transcription.task = t["task"].get<std::string>();
            if (t.contains("device")) cfg.transcription.device = t["device"].get<std::string>();
        }

        if (j.contains("input")) {
            auto& i = j["input"];
            if (i.contains("audio")) cfg.input.audio_path = i["audio"].get<std::string>();
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("formats")) {
                auto& fmts = o["formats"];
                cfg.output.formats = fmts.is_string()
                    ? split_list(fmts.get<std::string>())
                    : fmts.get<std::vector<std::string>>();
            }
            if (o.contains("root")) cfg.output.root = o["root"].get<std::string>();
        }

        if (j.contains("languages")) {
            cfg.languages = j["languages"].get<std::map<std::string, std::string>>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
