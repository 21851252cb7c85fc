#pragma once

#include <string>
#include <utility>
#include <variant>
#include <stdexcept>

namespace core {

    // Error taxonomy shared by every external call made from the polling loop
    enum class ErrorKind {
        Transient,          // Network failure or timeout, retried
        MalformedData,      // Empty or unparsable payload, treated like Transient
        Authentication,     // Signing / credential failure, fatal at startup only
        ExchangeRejection,  // Order refused (margin, invalid params)
        Notification,       // Chat delivery failure, logged and dropped
        Unexpected
    };

    inline const char* errorKindToString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::Transient:         return "Transient";
            case ErrorKind::MalformedData:     return "MalformedData";
            case ErrorKind::Authentication:    return "Authentication";
            case ErrorKind::ExchangeRejection: return "ExchangeRejection";
            case ErrorKind::Notification:      return "Notification";
            case ErrorKind::Unexpected:        return "Unexpected";
            default:                           return "Unknown";
        }
    }

    inline bool isRetryable(ErrorKind kind) {
        return kind == ErrorKind::Transient || kind == ErrorKind::MalformedData;
    }

    struct Error {
        ErrorKind kind = ErrorKind::Unexpected;
        std::string message;
    };

    // --- Result ---
    // Holds either a value or an Error. Callers switch on error().kind.
    template<typename T>
    class Result {
    public:
        Result(T value) : data_(std::move(value)) {}
        Result(Error error) : data_(std::move(error)) {}

        static Result failure(ErrorKind kind, std::string message) {
            return Result(Error{kind, std::move(message)});
        }

        bool ok() const { return std::holds_alternative<T>(data_); }
        explicit operator bool() const { return ok(); }

        const T& value() const {
            if (!ok()) {
                throw std::logic_error("Result::value() called on error: " + std::get<Error>(data_).message);
            }
            return std::get<T>(data_);
        }

        T& value() {
            if (!ok()) {
                throw std::logic_error("Result::value() called on error: " + std::get<Error>(data_).message);
            }
            return std::get<T>(data_);
        }

        const Error& error() const {
            if (ok()) {
                throw std::logic_error("Result::error() called on success");
            }
            return std::get<Error>(data_);
        }

    private:
        std::variant<T, Error> data_;
    };

    // Value-less acknowledgement (order accepted, message delivered)
    struct Ack {};
    using Status = Result<Ack>;

    inline Status success() { return Status(Ack{}); }

} // namespace core
