#include "curl_http_client.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <memory>

CurlHttpClient::CurlHttpClient(int timeout_ms)
    : timeout_ms_(timeout_ms) {}

size_t CurlHttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

HttpResponse CurlHttpClient::get(const std::string& url) {
    return perform(url, nullptr);
}

HttpResponse CurlHttpClient::post_json(const std::string& url, const std::string& body) {
    return perform(url, &body);
}

// One easy handle per request: pipeline workers call in concurrently.
HttpResponse CurlHttpClient::perform(const std::string& url, const std::string* post_body) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw HttpError("Failed to initialize CURL");
    }

    HttpResponse response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "swapwatch/1.0");

    struct curl_slist* headers = NULL;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (post_body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    }
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl.get());
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        spdlog::debug("HTTP request to {} failed: {}", url, curl_easy_strerror(res));
        throw HttpError(std::string("HTTP request failed: ") + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}
