#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct Config {
    struct Backend {
        std::string type = "lan";
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
    } backend;

    struct Transcription {
        std::string model = "small.en";
        std::string language = "auto";
        std::string task = "transcribe";
        std::string device = "auto";
    } transcription;

    struct Input {
        std::string audio_path; // used when no audio file is given on the command line
    } input;

    struct Output {
        std::vector<std::string> formats = {"txt"};
        std::string root = "outputs";
    } output;

    // Display name -> language code, e.g. "English" -> "en".
    std::map<std::string, std::string> languages;

    // Language code to send to the model, nullopt for auto-detect.
    std::optional<std::string> language_code() const;

    using EnvLookup = std::function<const char*(const char*)>;

    // Overrides fields from WHISPER_* variables.
    void apply_env(const EnvLookup& getenv);

    static Config load(const std::string& path);
    static Config load_default();

    // "English:en,Spanish:es"
    static std::map<std::string, std::string> parse_language_mapping(const std::string& s);
};
