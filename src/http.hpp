#pragma once

#include <string>
#include <vector>

#include "result.hpp"

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // headers are complete header lines, e.g. "Accept: application/json"
    // Error::Transport for connection problems and HTTP error statuses.
    virtual Result<std::string> get(const std::string& url, const std::vector<std::string>& headers)
        = 0;
};

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    Result<std::string> get(
        const std::string& url, const std::vector<std::string>& headers) override;
};
