#pragma once

#include "backend.hpp"

#include <string>

// Sends the audio file to a whisper.cpp server or an OpenAI-compatible
// endpoint. The server owns its compute device; the device given here is
// only reported in logs.
class LanBackend : public WhisperBackend {
public:
    // api_format: "whisper.cpp" or "openai"
    LanBackend(std::string url, std::string api_format, std::string model, Device device);
    ~LanBackend() override;

    LanBackend(const LanBackend&) = delete;
    LanBackend& operator=(const LanBackend&) = delete;

    std::expected<Transcript, std::string> transcribe(const InferenceRequest& request) override;

    // Parses a verbose_json response body into segments.
    static std::expected<Transcript, std::string> parse_response(const std::string& body);

    static BackendLoader loader(std::string url, std::string api_format);

private:
    std::string url_;
    std::string api_format_;
    std::string model_;
    Device device_;
};
