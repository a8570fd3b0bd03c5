#include "probe/server_prober.hpp"

#include "common/logging.hpp"
#include "net/oob_protocol.hpp"
#include "probe/concurrency_limiter.hpp"
#include "probe/status_response.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <system_error>
#include <thread>

namespace q2browse::probe {

ServerProber::ServerProber(ProbeOptions probeOptions,
                           net::DatagramExchanger &exchanger,
                           std::shared_ptr<spdlog::logger> logger)
    : options(probeOptions),
      exchanger(exchanger),
      logger(logger ? std::move(logger) : logging::ComponentLogger("prober")) {
    options.maxConcurrentProbes = std::max<std::size_t>(1, options.maxConcurrentProbes);
}

ProbeSummary ServerProber::probeServers(const std::vector<net::Endpoint> &endpoints,
                                        const RecordCallback &onRecord,
                                        const CancellationToken &cancellation) {
    ProbeSummary summary;
    if (endpoints.empty()) {
        return summary;
    }

    ConcurrencyLimiter limiter(options.maxConcurrentProbes);
    std::atomic<std::size_t> nextIndex{0};
    std::atomic<std::size_t> attempted{0};
    std::atomic<std::size_t> produced{0};
    std::mutex deliveryMutex;

    auto worker = [&]() {
        while (true) {
            auto permit = limiter.acquire(cancellation);
            if (!permit) {
                return;
            }
            const std::size_t index = nextIndex.fetch_add(1);
            if (index >= endpoints.size()) {
                return;
            }
            attempted.fetch_add(1);

            try {
                const ProbeRequest request{endpoints[index], options.timeout};
                auto record = probeOne(request, cancellation);
                if (!record) {
                    continue;
                }
                std::lock_guard<std::mutex> lock(deliveryMutex);
                if (cancellation.isCancelled()) {
                    return;
                }
                onRecord(*record);
                produced.fetch_add(1);
            } catch (const std::exception &ex) {
                logger->error("ServerProber: Probe of {} failed: {}", endpoints[index].toString(), ex.what());
            }
        }
    };

    const std::size_t workerCount = std::min(options.maxConcurrentProbes, endpoints.size());
    logger->debug("ServerProber: Probing {} endpoint(s) with {} worker(s), timeout {} ms",
                   endpoints.size(), workerCount, options.timeout.count());

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i) {
        try {
            workers.emplace_back(worker);
        } catch (const std::system_error &ex) {
            logger->warn("ServerProber: Started {} of {} workers: {}", workers.size(), workerCount, ex.what());
            break;
        }
    }
    if (workers.empty()) {
        logger->error("ServerProber: No probe workers could be started");
        return summary;
    }
    for (auto &thread : workers) {
        thread.join();
    }

    summary.attempted = std::min(attempted.load(), endpoints.size());
    summary.produced = produced.load();
    summary.cancelled = cancellation.isCancelled();
    logger->debug("ServerProber: {} of {} probe(s) answered{}", summary.produced, summary.attempted,
                   summary.cancelled ? " before cancellation" : "");
    return summary;
}

std::optional<ServerRecord> ServerProber::probeOne(const ProbeRequest &request, const CancellationToken &cancellation) {
    static const std::string query = oob::PrependOobHeader(oob::STATUS_QUERY);

    const auto result = exchanger.exchange(request.endpoint, query, request.timeout, cancellation);
    switch (result.status) {
    case net::ExchangeStatus::Ok:
        break;
    case net::ExchangeStatus::Timeout:
        logger->trace("ServerProber: {} timed out", request.endpoint.toString());
        return std::nullopt;
    case net::ExchangeStatus::Cancelled:
        return std::nullopt;
    case net::ExchangeStatus::Error:
        logger->debug("ServerProber: {} failed: {}", request.endpoint.toString(), result.error);
        return std::nullopt;
    }

    return ParseStatusResponse(result.payload, request.endpoint, result.roundTrip, logger.get());
}

} // namespace q2browse::probe
