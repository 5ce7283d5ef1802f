#pragma once

#include <string>

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Blocking HTTP. Implementations throw HttpError on transport failure;
// any response that arrived, whatever its status, is returned.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url) = 0;
    virtual HttpResponse post_json(const std::string& url, const std::string& body) = 0;
};
