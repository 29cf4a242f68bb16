/*
 * HTTP POST over libcurl implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/ai/http.hpp>
#include <webwright/ai/json_text.hpp>
#include <webwright/util/log.hpp>
#include <curl/curl.h>
#include <memory>

namespace webwright::ai {

static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpResponse http_post_json(const std::string& url, const std::vector<std::string>& headers,
                            const std::string& body, int timeout_seconds) {
    HttpResponse resp;
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) { resp.error = "curl-init-fail"; return resp; }

    struct curl_slist* raw = curl_slist_append(nullptr, "Content-Type: application/json");
    for (auto& h : headers) raw = curl_slist_append(raw, h.c_str());
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> list(raw, &curl_slist_free_all);

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    CURLcode rc = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
    resp.transport_ok = rc == CURLE_OK;
    if (!resp.transport_ok) resp.error = errbuf[0] ? errbuf : curl_easy_strerror(rc);
    log::debug("POST " + url + " -> " + std::to_string(resp.status) + (resp.error.empty() ? "" : " (" + resp.error + ")"));
    return resp;
}

std::string provider_error(const std::string& provider, const HttpResponse& resp) {
    std::string msg;
    if (auto m = json_string_field(resp.body, "message")) msg = *m;
    else if (!resp.error.empty()) msg = resp.error;
    return "(" + provider + " error code=" + std::to_string(resp.status) + (msg.empty() ? "" : " msg=" + msg) + ")";
}

} // namespace webwright::ai
