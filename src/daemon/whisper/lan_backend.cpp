#include "lan_backend.hpp"
#include "wav_codec.hpp"

#include <algorithm>
#include <cmath>
#include <curl/curl.h>
#include <format>
#include <memory>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

struct EasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
struct MimeDeleter {
    void operator()(curl_mime* m) const { curl_mime_free(m); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using MimeForm = std::unique_ptr<curl_mime, MimeDeleter>;

size_t append_body(char* data, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(data, size * nmemb);
    return size * nmemb;
}

} // namespace

LanBackend::LanBackend(std::string url, const std::string& api_format, std::string language,
                       std::chrono::seconds timeout, std::string prompt)
    : url_(std::move(url)),
      api_(api_format == "openai" ? Api::OpenAi : Api::WhisperCpp),
      language_(std::move(language)), timeout_(timeout), prompt_(std::move(prompt)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanBackend::~LanBackend() {
    curl_global_cleanup();
}

std::string LanBackend::endpoint(const std::string& base_url, Api api) {
    std::string base = base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + (api == Api::OpenAi ? "/v1/audio/transcriptions" : "/inference");
}

std::vector<std::pair<std::string, std::string>>
LanBackend::form_fields(Api api, const std::string& language, const std::string& prompt) {
    std::vector<std::pair<std::string, std::string>> fields = {
        {"response_format", "verbose_json"},
    };
    if (api == Api::OpenAi) {
        fields.emplace_back("model", "whisper-1");
    } else {
        fields.emplace_back("temperature", "0.0");
    }
    if (!language.empty()) fields.emplace_back("language", language);
    if (!prompt.empty()) fields.emplace_back("prompt", prompt);
    return fields;
}

std::expected<TranscriptResult, std::string>
LanBackend::transcribe(std::span<const int16_t> audio, uint32_t sample_rate, uint16_t channels) {
    if (audio.empty()) {
        return std::unexpected("empty audio");
    }
    const double duration_s = static_cast<double>(audio.size()) / channels / sample_rate;
    const auto wav_bytes = wav::encode(audio, sample_rate, channels);
    const auto started = std::chrono::steady_clock::now();

    EasyHandle curl(curl_easy_init());
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }
    MimeForm form(curl_mime_init(curl.get()));

    curl_mimepart* file = curl_mime_addpart(form.get());
    curl_mime_name(file, "file");
    curl_mime_data(file, reinterpret_cast<const char*>(wav_bytes.data()), wav_bytes.size());
    curl_mime_filename(file, "chunk.wav");
    curl_mime_type(file, "audio/wav");
    for (const auto& [key, value] : form_fields(api_, language_, prompt_)) {
        curl_mimepart* part = curl_mime_addpart(form.get());
        curl_mime_name(part, key.c_str());
        curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
    }

    const std::string url = endpoint(url_, api_);
    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, form.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 10L);
    // Worker threads must not take SIGALRM from the resolver.
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        return std::unexpected(url + ": " + curl_easy_strerror(rc));
    }
    long http_status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);

    auto result = parse_response(body);
    if (http_status >= 400) {
        // Carries the server's message when the body has one.
        return std::unexpected(std::format("HTTP {}{}", http_status,
                                           result ? std::string() : ": " + result.error()));
    }
    if (!result) return result;

    result->duration_s = duration_s;
    result->processing_s =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    return result;
}

std::expected<TranscriptResult, std::string> LanBackend::parse_response(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
    if (!j.is_object()) {
        return std::unexpected("unexpected response: " + body);
    }

    if (auto err = j.find("error"); err != j.end()) {
        std::string msg = err->is_string() ? err->get<std::string>()
                        : err->is_object() ? err->value("message", err->dump())
                                           : err->dump();
        return std::unexpected("server error: " + msg);
    }
    auto text = j.find("text");
    if (text == j.end() || !text->is_string()) {
        return std::unexpected("unexpected response: " + body);
    }

    double confidence_sum = 0.0;
    size_t scored = 0;
    if (auto segments = j.find("segments"); segments != j.end() && segments->is_array()) {
        for (const auto& seg : *segments) {
            auto lp = seg.find("avg_logprob");
            if (lp == seg.end() || !lp->is_number()) continue;
            confidence_sum += std::clamp(std::exp(lp->get<double>()), 0.0, 1.0);
            ++scored;
        }
    }

    return TranscriptResult{
        .text = trim_transcript(text->get<std::string>()),
        .confidence = scored > 0 ? confidence_sum / static_cast<double>(scored) : 1.0,
    };
}
