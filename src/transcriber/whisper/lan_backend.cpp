#include "lan_backend.hpp"

#include <curl/curl.h>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

LanBackend::LanBackend(std::string url, std::string api_format, std::string model, Device device)
    : url_(std::move(url)), api_format_(std::move(api_format)),
      model_(std::move(model)), device_(device) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanBackend::~LanBackend() {
    curl_global_cleanup();
}

BackendLoader LanBackend::loader(std::string url, std::string api_format) {
    return [url = std::move(url), api_format = std::move(api_format)](const std::string& model, Device device)
        -> std::expected<std::unique_ptr<WhisperBackend>, std::string> {
        if (url.empty()) {
            return std::unexpected("no server url configured");
        }
        return std::make_unique<LanBackend>(url, api_format, model, device);
    };
}

std::expected<Transcript, std::string> LanBackend::transcribe(const InferenceRequest& request) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(request.audio_path, ec)) {
        return std::unexpected("audio file not found: " + request.audio_path);
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_filedata(part, request.audio_path.c_str());

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "response_format");
    curl_mime_data(part, "verbose_json", CURL_ZERO_TERMINATED);

    if (request.language) {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "language");
        curl_mime_data(part, request.language->c_str(), CURL_ZERO_TERMINATED);
    }

    if (api_format_ == "openai") {
        endpoint = url_ + (request.task == Task::Translate ? "/v1/audio/translations"
                                                           : "/v1/audio/transcriptions");

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "model");
        curl_mime_data(part, model_.c_str(), CURL_ZERO_TERMINATED);
    } else {
        // whisper.cpp server format
        endpoint = url_ + "/inference";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "temperature");
        curl_mime_data(part, "0.0", CURL_ZERO_TERMINATED);

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "translate");
        curl_mime_data(part, request.task == Task::Translate ? "true" : "false",
                       CURL_ZERO_TERMINATED);
    }

    std::println(stderr, "lan: {} ({} on {}) -> {}", request.audio_path, model_,
                 device_name(device_), endpoint);

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (http_status >= 400) {
        return std::unexpected("server returned HTTP " + std::to_string(http_status) +
                               ": " + response_body);
    }

    return parse_response(response_body);
}

std::expected<Transcript, std::string> LanBackend::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);

        if (j.contains("error")) {
            auto& err = j["error"];
            if (err.is_object()) {
                return std::unexpected("server error: " + err.value("message", err.dump()));
            }
            return std::unexpected("server error: " +
                                   (err.is_string() ? err.get<std::string>() : err.dump()));
        }
        if (!j.contains("segments") || !j["segments"].is_array()) {
            return std::unexpected("unexpected response: " + body);
        }

        Transcript t;
        t.language = j.value("language", "");
        for (auto& s : j["segments"]) {
            t.segments.push_back(Segment{
                .start = s.at("start").get<double>(),
                .end = s.at("end").get<double>(),
                .text = s.value("text", ""),
            });
        }
        return t;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
