#include "http_fetcher.h"

#include "common.h"

#include <curl/curl.h>

#include <memory>

namespace {

// curl_global_init is not thread safe, do it once before the first handle
class CurlGlobal {
public:
    CurlGlobal()
        : code_(curl_global_init(CURL_GLOBAL_DEFAULT)) {
    }

    ~CurlGlobal() {
        if (code_ == CURLE_OK) {
            curl_global_cleanup();
        }
    }

    CURLcode GetCode() const {
        return code_;
    }

private:
    CURLcode code_;
};

const CurlGlobal& InitCurl() {
    static CurlGlobal global;
    return global;
}

size_t AppendBody(char* data, size_t size, size_t count, void* user_data) {
    auto* body = static_cast<std::string*>(user_data);
    body->append(data, size * count);
    return size * count;
}

FormulaError NetworkError(const std::string& url, const std::string& reason) {
    return FormulaError(FormulaError::Category::Network, "GET " + url + ": " + reason);
}

}  // namespace

CurlHttpFetcher::CurlHttpFetcher(long timeout_seconds)
    : timeout_seconds_(timeout_seconds) {
}

std::string CurlHttpFetcher::Fetch(const std::string& url) {
    if (InitCurl().GetCode() != CURLE_OK) {
        throw NetworkError(url, curl_easy_strerror(InitCurl().GetCode()));
    }

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(), &curl_easy_cleanup);
    if (!handle) {
        throw NetworkError(url, "cannot create a curl handle");
    }

    std::string body;
    char error_buffer[CURL_ERROR_SIZE] = {};
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, &AppendBody);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, "gridcalc");
    if (timeout_seconds_ > 0) {
        curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT, timeout_seconds_);
    }

    CURLcode code = curl_easy_perform(handle.get());
    if (code != CURLE_OK) {
        throw NetworkError(url, error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(code));
    }

    long status = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
    // file:// and similar schemes report 0
    if (status != 0 && (status < 200 || status >= 300)) {
        throw NetworkError(url, "HTTP status " + std::to_string(status));
    }
    return body;
}
