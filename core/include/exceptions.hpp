#pragma once

#include <stdexcept>
#include <string>

namespace core {

    // Raised for failures outside the polling loop (construction, config, startup).
    // Per-cycle failures travel as core::Result instead (see result.hpp).
    class TradingPlatformException : public std::runtime_error {
    public:
        explicit TradingPlatformException(const std::string& message)
            : std::runtime_error(message) {}

        explicit TradingPlatformException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    // Fatal: the process refuses to start with broken credentials
    class AuthenticationException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class ApiRequestException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class IndicatorCalculationException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class StrategyException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

} // namespace core
