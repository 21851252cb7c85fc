#include "connectivity_probe.hpp"
#include "logging.hpp"
#include <cpr/cpr.h>

namespace supervisor {

    HttpConnectivityProbe::HttpConnectivityProbe(std::string url, int timeout_ms)
        : url_(std::move(url)), timeout_ms_(timeout_ms)
    {}

    ProbeResult HttpConnectivityProbe::probe() {
        ProbeResult result;
        cpr::Response response = cpr::Get(cpr::Url{url_}, cpr::Timeout{timeout_ms_});

        // cpr reports elapsed wall time in seconds
        result.latency = std::chrono::milliseconds(static_cast<long long>(response.elapsed * 1000.0));

        if (response.error.code != cpr::ErrorCode::OK) {
            result.detail = response.error.message;
        } else if (response.status_code == 0 || response.status_code >= 500) {
            result.detail = "HTTP " + std::to_string(response.status_code);
        } else {
            result.reachable = true;
        }

        core::logging::getLogger()->debug("Connectivity probe {}: {} in {} ms{}", url_,
                                          result.reachable ? "reachable" : "UNREACHABLE",
                                          result.latency.count(),
                                          result.detail.empty() ? "" : " (" + result.detail + ")");
        return result;
    }

} // namespace supervisor
