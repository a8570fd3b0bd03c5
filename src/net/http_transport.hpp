#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "common/cancellation.hpp"

namespace q2browse::net {

struct HttpRequest {
    std::string url;
    std::chrono::seconds timeout{10};
    // 0 disables the cap.
    std::size_t maxBodyBytes = 0;
};

struct HttpResponse {
    bool transferOk = false;
    long status = 0;
    std::string contentType;
    std::string body;
    bool bodyLimitExceeded = false;
    bool cancelled = false;
    std::string error;
};

// Long-lived and shared by every caller; implementations must be thread-safe.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse get(const HttpRequest &request, const CancellationToken &cancellation) = 0;
};

// libcurl transport. Connections, DNS lookups and TLS sessions are cached in
// a share handle so repeated refreshes reuse sockets.
class CurlHttpTransport final : public HttpTransport {
public:
    CurlHttpTransport();
    ~CurlHttpTransport() override;

    CurlHttpTransport(const CurlHttpTransport &) = delete;
    CurlHttpTransport &operator=(const CurlHttpTransport &) = delete;

    bool isReady() const { return share != nullptr; }

    HttpResponse get(const HttpRequest &request, const CancellationToken &cancellation) override;

private:
    struct ShareState;

    std::unique_ptr<ShareState> shareState;
    void *share = nullptr;
};

} // namespace q2browse::net
