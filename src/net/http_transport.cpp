#include "net/http_transport.hpp"

#include "common/curl_global.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <array>
#include <mutex>

namespace {

struct TransferState {
    std::string *body = nullptr;
    std::size_t maxBodyBytes = 0;
    bool limitExceeded = false;
    const q2browse::CancellationToken *cancellation = nullptr;
};

size_t CurlWriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    const size_t total = size * nmemb;
    auto *state = static_cast<TransferState *>(userdata);
    if (state->maxBodyBytes > 0 && state->body->size() + total > state->maxBodyBytes) {
        state->limitExceeded = true;
        // Returning a short count aborts the transfer with CURLE_WRITE_ERROR.
        return 0;
    }
    state->body->append(ptr, total);
    return total;
}

int CurlProgressCallback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto *state = static_cast<TransferState *>(clientp);
    if (state->cancellation && state->cancellation->isCancelled()) {
        return 1;
    }
    return 0;
}

} // namespace

namespace q2browse::net {

struct CurlHttpTransport::ShareState {
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks;

    static void Lock(CURL *, curl_lock_data data, curl_lock_access, void *userptr) {
        auto *state = static_cast<ShareState *>(userptr);
        state->locks[static_cast<std::size_t>(data)].lock();
    }

    static void Unlock(CURL *, curl_lock_data data, void *userptr) {
        auto *state = static_cast<ShareState *>(userptr);
        state->locks[static_cast<std::size_t>(data)].unlock();
    }
};

CurlHttpTransport::CurlHttpTransport()
    : shareState(std::make_unique<ShareState>()) {
    if (!EnsureCurlGlobalInit()) {
        spdlog::warn("CurlHttpTransport: Failed to initialize cURL");
        return;
    }

    CURLSH *handle = curl_share_init();
    if (!handle) {
        spdlog::warn("CurlHttpTransport: curl_share_init failed");
        return;
    }
    curl_share_setopt(handle, CURLSHOPT_LOCKFUNC, &ShareState::Lock);
    curl_share_setopt(handle, CURLSHOPT_UNLOCKFUNC, &ShareState::Unlock);
    curl_share_setopt(handle, CURLSHOPT_USERDATA, shareState.get());
    curl_share_setopt(handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    if (curl_share_setopt(handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT) != CURLSHE_OK) {
        spdlog::debug("CurlHttpTransport: Connection sharing unavailable; DNS and TLS caches still shared");
    }
    share = handle;
}

CurlHttpTransport::~CurlHttpTransport() {
    if (share) {
        curl_share_cleanup(static_cast<CURLSH *>(share));
        share = nullptr;
    }
}

HttpResponse CurlHttpTransport::get(const HttpRequest &request, const CancellationToken &cancellation) {
    HttpResponse response;
    if (!EnsureCurlGlobalInit()) {
        response.error = "curl global init failed";
        return response;
    }

    CURL *curlHandle = curl_easy_init();
    if (!curlHandle) {
        response.error = "curl_easy_init failed";
        return response;
    }

    TransferState state;
    state.body = &response.body;
    state.maxBodyBytes = request.maxBodyBytes;
    state.cancellation = &cancellation;

    char errorBuffer[CURL_ERROR_SIZE];
    errorBuffer[0] = '\0';

    curl_easy_setopt(curlHandle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curlHandle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curlHandle, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curlHandle, CURLOPT_TIMEOUT, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curlHandle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curlHandle, CURLOPT_USERAGENT, "q2browse/1.0");
    curl_easy_setopt(curlHandle, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curlHandle, CURLOPT_WRITEFUNCTION, CurlWriteCallback);
    curl_easy_setopt(curlHandle, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curlHandle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curlHandle, CURLOPT_XFERINFOFUNCTION, CurlProgressCallback);
    curl_easy_setopt(curlHandle, CURLOPT_XFERINFODATA, &state);
    if (share) {
        curl_easy_setopt(curlHandle, CURLOPT_SHARE, static_cast<CURLSH *>(share));
    }

    const CURLcode result = curl_easy_perform(curlHandle);

    long status = 0;
    curl_easy_getinfo(curlHandle, CURLINFO_RESPONSE_CODE, &status);
    response.status = status;

    char *contentType = nullptr;
    if (curl_easy_getinfo(curlHandle, CURLINFO_CONTENT_TYPE, &contentType) == CURLE_OK && contentType) {
        response.contentType = contentType;
    }
    curl_easy_cleanup(curlHandle);

    response.bodyLimitExceeded = state.limitExceeded;
    if (result == CURLE_ABORTED_BY_CALLBACK && cancellation.isCancelled()) {
        response.cancelled = true;
        response.error = "cancelled";
        return response;
    }
    if (result != CURLE_OK) {
        if (state.limitExceeded) {
            response.error = "response body exceeds " + std::to_string(request.maxBodyBytes) + " bytes";
        } else if (errorBuffer[0] != '\0') {
            response.error = errorBuffer;
        } else {
            response.error = curl_easy_strerror(result);
        }
        return response;
    }

    response.transferOk = true;
    return response;
}

} // namespace q2browse::net
