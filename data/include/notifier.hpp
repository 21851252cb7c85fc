#pragma once

#include <string>
#include "result.hpp"

namespace data {

// Chat delivery. Fire-and-forget: callers log a failed Status and carry on;
// delivery problems never reach the signal or trade state.
class INotifier {
public:
    virtual ~INotifier() = default;

    virtual core::Status sendMessage(const std::string& text) = 0;
    virtual core::Status sendDocument(const std::string& path, const std::string& caption) = 0;
};

// Used when no chat channel is configured: messages end up in the main log
class LogNotifier : public INotifier {
public:
    core::Status sendMessage(const std::string& text) override;
    core::Status sendDocument(const std::string& path, const std::string& caption) override;
};

// Logs a failed notification at warn level; returns whether it was delivered
bool reportDelivery(const core::Status& status, const char* what);

} // namespace data
