#pragma once

#include <chrono>
#include <string>

namespace supervisor {

    struct ProbeResult {
        bool reachable = false;
        std::chrono::milliseconds latency{0};
        std::string detail;   // Transport error or HTTP status when unreachable
    };

    class IConnectivityProbe {
    public:
        virtual ~IConnectivityProbe() = default;
        virtual ProbeResult probe() = 0;
    };

    // Lightweight GET against a public endpoint (exchange ping). Any HTTP answer
    // below 500 counts as reachable.
    class HttpConnectivityProbe : public IConnectivityProbe {
    public:
        HttpConnectivityProbe(std::string url, int timeout_ms);

        ProbeResult probe() override;

    private:
        std::string url_;
        int timeout_ms_;
    };

} // namespace supervisor
