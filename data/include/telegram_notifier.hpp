#pragma once

#include <string>
#include "notifier.hpp"

namespace data {

// Telegram Bot API: sendMessage (form post) and sendDocument (multipart upload)
class TelegramNotifier : public INotifier {
public:
    TelegramNotifier(std::string api_base_url, std::string bot_token, std::string chat_id, int timeout_ms);

    core::Status sendMessage(const std::string& text) override;
    core::Status sendDocument(const std::string& path, const std::string& caption) override;

private:
    std::string methodUrl(const char* method) const;

    std::string api_base_url_;
    std::string bot_token_;
    std::string chat_id_;
    int timeout_ms_;
};

} // namespace data
