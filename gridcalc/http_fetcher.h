#pragma once

#include <string>

// Transport behind GET. Fetch blocks until the whole body is received and
// throws FormulaError::Category::Network on any failure.
class HttpFetcher {
public:
    virtual ~HttpFetcher() = default;
    virtual std::string Fetch(const std::string& url) = 0;
};

class CurlHttpFetcher : public HttpFetcher {
public:
    // 0 means no timeout
    explicit CurlHttpFetcher(long timeout_seconds = 0);

    std::string Fetch(const std::string& url) override;

private:
    long timeout_seconds_;
};
