#pragma once
#include <string>

struct HttpResponse {
    long status{0};
    std::string body;
};

// Plain HTTPS GET via libcurl. Throws TransportError when the request
// cannot be performed; HTTP status is left for the caller to judge.
HttpResponse http_get(const std::string& url, long timeout_s = 10);
