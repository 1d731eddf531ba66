#include "http.hpp"

#include <memory>

#include <curl/curl.h>

#include "debug.hpp"

namespace {
size_t writeCallback(char* data, size_t size, size_t nmemb, void* userData)
{
    auto body = static_cast<std::string*>(userData);
    body->append(data, size * nmemb);
    return size * nmemb;
}
}

CurlHttpClient::CurlHttpClient()
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient()
{
    curl_global_cleanup();
}

Result<std::string> CurlHttpClient::get(
    const std::string& url, const std::vector<std::string>& headers)
{
    auto curl = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>(
        curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        debug("curl_easy_init failed");
        return error(Error::Transport);
    }

    auto headerList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>(
        nullptr, &curl_slist_free_all);
    for (const auto& header : headers) {
        const auto list = curl_slist_append(headerList.get(), header.c_str());
        if (!list)
            return error(Error::Transport);
        headerList.release();
        headerList.reset(list);
    }

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "footy/0.1");
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

    debug("GET {}", url);
    const auto code = curl_easy_perform(curl.get());
    if (code != CURLE_OK) {
        debug("Request failed: {}", curl_easy_strerror(code));
        return error(Error::Transport);
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    debug("Status {}, {} bytes", status, body.size());
    if (status >= 400)
        return error(Error::Transport);

    return body;
}
