#include "discovery/http_master_client.hpp"

#include "common/logging.hpp"
#include "net/oob_protocol.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string toLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool startsWithNoCase(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    return toLower(text.substr(0, prefix.size())) == prefix;
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

std::vector<q2browse::net::Endpoint> parseRecords(std::string_view data, std::size_t offset, std::size_t chunkSize) {
    std::vector<q2browse::net::Endpoint> endpoints;
    if (chunkSize < q2browse::oob::ADDRESS_RECORD_SIZE) {
        return endpoints;
    }
    for (; offset + chunkSize <= data.size(); offset += chunkSize) {
        if (auto endpoint = q2browse::oob::ParseEndpoint(data, offset)) {
            endpoints.push_back(*endpoint);
        }
    }
    return endpoints;
}

} // namespace

namespace q2browse::discovery {

bool IsValidHttpUrl(const std::string &url) {
    std::size_t hostStart = 0;
    if (startsWithNoCase(url, "http://")) {
        hostStart = 7;
    } else if (startsWithNoCase(url, "https://")) {
        hostStart = 8;
    } else {
        return false;
    }
    if (std::any_of(url.begin(), url.end(), [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); })) {
        return false;
    }
    const std::size_t hostEnd = url.find_first_of("/?#", hostStart);
    const std::string_view authority = std::string_view(url).substr(hostStart, hostEnd == std::string::npos
                                                                                   ? std::string::npos
                                                                                   : hostEnd - hostStart);
    const std::size_t userInfo = authority.rfind('@');
    const std::string_view hostPort = userInfo == std::string_view::npos ? authority : authority.substr(userInfo + 1);
    if (hostPort.empty() || hostPort.front() == ':') {
        return false;
    }
    return true;
}

bool LooksLikeHtml(std::string_view body) {
    std::size_t start = 0;
    while (start < body.size() && std::isspace(static_cast<unsigned char>(body[start]))) {
        ++start;
    }
    const std::string_view head = body.substr(start);
    return startsWithNoCase(head, "<html") || startsWithNoCase(head, "<!doctype");
}

bool IsTextualContentType(std::string_view contentType) {
    if (contentType.empty()) {
        return false;
    }
    const std::string lowered = toLower(contentType);
    if (lowered.find("octet-stream") != std::string::npos || lowered.find("application/") != std::string::npos) {
        return false;
    }
    return lowered.find("text/") != std::string::npos || lowered.find("html") != std::string::npos;
}

std::vector<net::Endpoint> ParseServerListBody(std::string_view body) {
    if (body.empty()) {
        return {};
    }

    if (body[0] == '+' || body[0] == '-') {
        std::size_t offset = 1;
        std::size_t chunkSize = oob::ADDRESS_RECORD_SIZE;
        if (body.size() > 2) {
            // The first record may itself begin with digit bytes, so the size is
            // the shortest digit prefix (at most 4) naming a record of 6 or more,
            // preferring one whose stride tiles the rest of the body.
            std::size_t digits = 0;
            while (digits < 4 && 1 + digits < body.size() && isDigit(body[1 + digits])) {
                ++digits;
            }
            if (digits > 0) {
                std::size_t fallbackLength = 0;
                std::size_t chosenLength = 0;
                for (std::size_t length = 1; length <= digits; ++length) {
                    const std::size_t candidate = std::stoul(std::string(body.substr(1, length)));
                    if (candidate < oob::ADDRESS_RECORD_SIZE) {
                        continue;
                    }
                    if ((body.size() - 1 - length) % candidate == 0) {
                        chosenLength = length;
                        break;
                    }
                    if (fallbackLength == 0) {
                        fallbackLength = length;
                    }
                }
                if (chosenLength == 0) {
                    chosenLength = fallbackLength;
                }
                if (chosenLength == 0) {
                    return {};
                }
                chunkSize = std::stoul(std::string(body.substr(1, chosenLength)));
                offset = 1 + chosenLength;
            }
        }
        return parseRecords(body, offset, chunkSize);
    }

    if (oob::HasOobHeader(body)) {
        return parseRecords(oob::RemoveOobHeader(body), 0, oob::ADDRESS_RECORD_SIZE);
    }

    return parseRecords(body, 0, oob::ADDRESS_RECORD_SIZE);
}

HttpMasterClient::HttpMasterClient(std::string url,
                                   std::chrono::seconds timeout,
                                   net::HttpTransport &transport,
                                   std::shared_ptr<spdlog::logger> logger)
    : url(std::move(url)),
      timeout(timeout),
      transport(transport),
      logger(logger ? std::move(logger) : logging::ComponentLogger("http-master")) {}

std::vector<net::Endpoint> HttpMasterClient::queryServers(const CancellationToken &cancellation) {
    try {
        return fetch(cancellation);
    } catch (const std::exception &ex) {
        logger->error("HttpMasterClient: Error fetching {}: {}", url, ex.what());
    }
    return {};
}

std::vector<net::Endpoint> HttpMasterClient::fetch(const CancellationToken &cancellation) {
    if (url.empty()) {
        logger->warn("HttpMasterClient: HTTP master server URL is not configured");
        return {};
    }
    if (!IsValidHttpUrl(url)) {
        logger->error("HttpMasterClient: Invalid HTTP master server URL: {}", url);
        return {};
    }
    if (cancellation.isCancelled()) {
        return {};
    }

    logger->info("HttpMasterClient: Fetching server list from {}", url);
    net::HttpRequest request;
    request.url = url;
    request.timeout = timeout;
    request.maxBodyBytes = MAX_HTTP_RESPONSE_BYTES;
    const net::HttpResponse response = transport.get(request, cancellation);

    if (response.cancelled) {
        logger->debug("HttpMasterClient: Request cancelled");
        return {};
    }
    if (response.bodyLimitExceeded || response.body.size() > MAX_HTTP_RESPONSE_BYTES) {
        logger->error("HttpMasterClient: Response from {} exceeds {} bytes", url, MAX_HTTP_RESPONSE_BYTES);
        return {};
    }
    if (!response.transferOk) {
        logger->warn("HttpMasterClient: Request to {} failed: {}", url, response.error);
        return {};
    }
    if (response.status < 200 || response.status >= 300) {
        logger->warn("HttpMasterClient: Request to {} returned status {}", url, response.status);
        return {};
    }

    logger->debug("HttpMasterClient: Response Content-Type: {}", response.contentType);
    logger->info("HttpMasterClient: Received {} bytes", response.body.size());
    if (response.body.empty()) {
        logger->warn("HttpMasterClient: HTTP master server returned an empty response");
        return {};
    }
    if (LooksLikeHtml(response.body)) {
        logger->error("HttpMasterClient: Response is an HTML page (likely an error page); check the URL");
        return {};
    }
    if (IsTextualContentType(response.contentType)) {
        logger->error("HttpMasterClient: Unexpected content type {}; expected binary data", response.contentType);
        return {};
    }

    auto endpoints = ParseServerListBody(response.body);
    if (endpoints.size() > MAX_HTTP_SERVERS) {
        logger->warn("HttpMasterClient: {} servers listed, limiting to {}", endpoints.size(), MAX_HTTP_SERVERS);
        endpoints.resize(MAX_HTTP_SERVERS);
    }
    logger->info("HttpMasterClient: Parsed {} server(s)", endpoints.size());
    return endpoints;
}

} // namespace q2browse::discovery
