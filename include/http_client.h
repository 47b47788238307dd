#pragma once

/**
 * @file http_client.h
 * @brief Minimal blocking HTTP POST over libcurl
 *
 * curl_global_init() must have been called once by the process before any
 * request (main does this).
 */

#include "errors.h"
#include <string>
#include <vector>
#include <cstdint>

namespace guild_voice {

struct HttpResponse {
    long status = 0;
    std::string body;

    bool is_success() const { return status >= 200 && status < 300; }
};

/**
 * @brief One part of a multipart/form-data body
 */
struct MultipartField {
    std::string name;
    std::string value;          // Field value, or file bytes when filename is set
    std::string filename;       // Non-empty marks a file part
    std::string content_type;   // e.g. "audio/wav"
};

/**
 * @brief POST a JSON body
 * @param bearer_token Sent as "Authorization: Bearer <token>" when non-empty
 * @return Response (any status), or NetworkError when the transfer failed
 */
Result<HttpResponse> http_post_json(const std::string& url,
                                    const std::string& json_body,
                                    const std::string& bearer_token,
                                    int timeout_ms);

/**
 * @brief POST a multipart/form-data body
 */
Result<HttpResponse> http_post_multipart(const std::string& url,
                                         const std::vector<MultipartField>& fields,
                                         const std::string& bearer_token,
                                         int timeout_ms);

} // namespace guild_voice
