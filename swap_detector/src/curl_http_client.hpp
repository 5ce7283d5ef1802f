#pragma once

#include "http_client.hpp"
#include <curl/curl.h>

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(int timeout_ms = 8000);

    HttpResponse get(const std::string& url) override;
    HttpResponse post_json(const std::string& url, const std::string& body) override;

private:
    int timeout_ms_;

    HttpResponse perform(const std::string& url, const std::string* post_body);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
