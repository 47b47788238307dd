#include "http_client.h"
#include "logger.h"
#include <curl/curl.h>

namespace guild_voice {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* buffer = static_cast<std::string*>(userp);
    size_t total_size = size * nmemb;
    buffer->append(static_cast<char*>(contents), total_size);
    return total_size;
}

struct curl_slist* auth_headers(struct curl_slist* headers, const std::string& bearer_token) {
    if (!bearer_token.empty()) {
        headers = curl_slist_append(headers, ("Authorization: Bearer " + bearer_token).c_str());
    }
    return headers;
}

/// Runs a prepared handle and collects the body; takes ownership of headers
Result<HttpResponse> perform(CURL* curl, struct curl_slist* headers,
                             const std::string& url, int timeout_ms) {
    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 5000L);
    if (timeout_ms > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    }

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return make_network_error(std::string("POST ") + url + " failed: " + curl_easy_strerror(res));
    }
    LOG_DEBUG("POST " + url + " -> " + std::to_string(response.status) +
              " (" + std::to_string(response.body.size()) + " bytes)");
    return response;
}

} // anonymous namespace

Result<HttpResponse> http_post_json(const std::string& url,
                                    const std::string& json_body,
                                    const std::string& bearer_token,
                                    int timeout_ms) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_network_error("Failed to initialize CURL");
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = auth_headers(headers, bearer_token);

    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body.size()));

    return perform(curl, headers, url, timeout_ms);
}

Result<HttpResponse> http_post_multipart(const std::string& url,
                                         const std::vector<MultipartField>& fields,
                                         const std::string& bearer_token,
                                         int timeout_ms) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_network_error("Failed to initialize CURL");
    }

    curl_mime* mime = curl_mime_init(curl);
    for (const auto& field : fields) {
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, field.name.c_str());
        curl_mime_data(part, field.value.data(), field.value.size());
        if (!field.filename.empty()) {
            curl_mime_filename(part, field.filename.c_str());
        }
        if (!field.content_type.empty()) {
            curl_mime_type(part, field.content_type.c_str());
        }
    }
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);

    struct curl_slist* headers = auth_headers(nullptr, bearer_token);
    auto result = perform(curl, headers, url, timeout_ms);
    curl_mime_free(mime);
    return result;
}

} // namespace guild_voice
