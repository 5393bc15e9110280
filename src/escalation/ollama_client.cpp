#include "photo_triage/escalation/escalation.hpp"
#include "photo_triage/core/errors.hpp"
#include "photo_triage/core/utils.hpp"

#include <curl/curl.h>
#include <algorithm>

namespace photo_triage::escalation {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response) {
    const size_t total = size * nmemb;
    response->append(static_cast<char*>(contents), total);
    return total;
}

} // namespace

OllamaVisionClient::OllamaVisionClient(const OllamaOptions& opt) : opt_(opt) {
    if (opt_.endpoint.empty()) {
        throw ConfigError("escalation endpoint is empty");
    }
    if (opt_.model.empty()) {
        throw ConfigError("escalation model is empty");
    }
}

std::string OllamaVisionClient::describe() const {
    return "ollama:" + opt_.model + "@" + opt_.endpoint;
}

std::string OllamaVisionClient::chat_url() const {
    std::string base = opt_.endpoint;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (core::ends_with(base, "/api/chat")) {
        return base;
    }
    return base + "/api/chat";
}

json OllamaVisionClient::build_request(const std::string& image_base64,
                                       const std::string& instruction) const {
    return {
        {"model", opt_.model},
        {"messages", json::array({
            {
                {"role", "user"},
                {"content", instruction},
                {"images", json::array({image_base64})}
            }
        })},
        {"stream", false},
        {"format", verdict_json_schema()}
    };
}

std::string OllamaVisionClient::extract_content(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw EscalationMalformedResponse(std::string("response is not JSON: ") + e.what());
    }

    if (j.is_object() && j.contains("error")) {
        const std::string msg = j["error"].is_string() ? j["error"].get<std::string>()
                                                       : j["error"].dump();
        throw EscalationUnavailable(msg);
    }
    if (!j.is_object() || !j.contains("message") || !j["message"].is_object() ||
        !j["message"].contains("content") || !j["message"]["content"].is_string()) {
        throw EscalationMalformedResponse("missing message.content");
    }
    return core::trim(j["message"]["content"].get<std::string>());
}

std::string OllamaVisionClient::analyze(const std::vector<uint8_t>& image_bytes,
                                        const std::string& instruction) {
    const std::string url = chat_url();
    const std::string payload = build_request(core::base64_encode(image_bytes), instruction).dump();

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw EscalationUnavailable("failed to initialize curl");
    }

    std::string response;
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(opt_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(std::min(opt_.timeout_seconds, 10)));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        std::string msg = errbuf[0] != '\0' ? std::string(errbuf) : curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        if (res == CURLE_OPERATION_TIMEDOUT) {
            throw EscalationTimeout(url + ": " + msg);
        }
        throw EscalationUnavailable(url + ": " + msg);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (http_code < 200 || http_code >= 300) {
        throw EscalationUnavailable(url + " returned HTTP " + std::to_string(http_code));
    }
    return extract_content(response);
}

} // namespace photo_triage::escalation
