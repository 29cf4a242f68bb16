/*
 * HTTP POST over libcurl - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>

namespace webwright::ai {

struct HttpResponse {
    bool transport_ok = false;  // curl_easy_perform succeeded
    long status = 0;
    std::string body;
    std::string error;          // curl error text when transport failed

    bool ok() const { return transport_ok && status / 100 == 2; }
};

// POSTs a JSON body. "Content-Type: application/json" is always sent.
HttpResponse http_post_json(const std::string& url, const std::vector<std::string>& headers,
                            const std::string& body, int timeout_seconds);

// "(<provider> error code=<status> msg=<message>)" built from the response.
std::string provider_error(const std::string& provider, const HttpResponse& resp);

} // namespace webwright::ai
