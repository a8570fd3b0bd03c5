#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/cancellation.hpp"
#include "net/endpoint.hpp"
#include "net/http_transport.hpp"

namespace q2browse::discovery {

constexpr std::size_t MAX_HTTP_RESPONSE_BYTES = 50 * 1024 * 1024;
constexpr std::size_t MAX_HTTP_SERVERS = 10000;

bool IsValidHttpUrl(const std::string &url);
// Body starts like an HTML document (error pages, captive portals).
bool LooksLikeHtml(std::string_view body);
// Declared type is text or HTML and not a binary/application type.
bool IsTextualContentType(std::string_view contentType);

// Decodes a mirror body: "+N"/"-N" prefixed records of N bytes, an OOB
// framed list or bare 6-byte records. Not capped.
std::vector<net::Endpoint> ParseServerListBody(std::string_view body);

// Fetches the server list published by an HTTP master mirror. The transport
// is borrowed and must outlive the client.
class HttpMasterClient {
public:
    HttpMasterClient(std::string url,
                     std::chrono::seconds timeout,
                     net::HttpTransport &transport,
                     std::shared_ptr<spdlog::logger> logger = nullptr);

    // Never throws; every failure yields an empty list and a log entry.
    std::vector<net::Endpoint> queryServers(const CancellationToken &cancellation);

private:
    std::vector<net::Endpoint> fetch(const CancellationToken &cancellation);

    std::string url;
    std::chrono::seconds timeout;
    net::HttpTransport &transport;
    std::shared_ptr<spdlog::logger> logger;
};

} // namespace q2browse::discovery
