#include "telegram_notifier.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <filesystem>

namespace data {

namespace {

    core::Status toStatus(const cpr::Response& response, const char* method) {
        if (response.error) {
            return core::Status::failure(core::ErrorKind::Notification,
                fmt::format("{} failed: {}", method, response.error.message));
        }
        if (response.status_code != 200) {
            // Telegram explains refusals in "description"
            std::string description = response.text.substr(0, 200);
            try {
                auto body = nlohmann::json::parse(response.text);
                if (body.contains("description") && body["description"].is_string()) {
                    description = body["description"].get<std::string>();
                }
            } catch (const nlohmann::json::exception&) {
                // Not JSON; keep the raw text
            }
            return core::Status::failure(core::ErrorKind::Notification,
                fmt::format("{} returned HTTP {}: {}", method, response.status_code, description));
        }
        return core::success();
    }

} // end anonymous namespace

TelegramNotifier::TelegramNotifier(std::string api_base_url, std::string bot_token, std::string chat_id, int timeout_ms)
    : api_base_url_(std::move(api_base_url)),
      bot_token_(std::move(bot_token)),
      chat_id_(std::move(chat_id)),
      timeout_ms_(timeout_ms)
{
    if (bot_token_.empty() || chat_id_.empty()) {
        throw core::ConfigException("TelegramNotifier requires a bot token and a chat id.");
    }
    core::logging::getLogger()->debug("TelegramNotifier created for chat {}", chat_id_);
}

std::string TelegramNotifier::methodUrl(const char* method) const {
    return fmt::format("{}/bot{}/{}", api_base_url_, bot_token_, method);
}

core::Status TelegramNotifier::sendMessage(const std::string& text) {
    cpr::Response response = cpr::Post(
        cpr::Url{methodUrl("sendMessage")},
        cpr::Payload{{"chat_id", chat_id_}, {"text", text}},
        cpr::Timeout{timeout_ms_});
    return toStatus(response, "sendMessage");
}

core::Status TelegramNotifier::sendDocument(const std::string& path, const std::string& caption) {
    if (!std::filesystem::exists(path)) {
        return core::Status::failure(core::ErrorKind::Notification, "document not found: " + path);
    }
    cpr::Response response = cpr::Post(
        cpr::Url{methodUrl("sendDocument")},
        cpr::Multipart{{"chat_id", chat_id_},
                       {"caption", caption},
                       {"document", cpr::File{path}}},
        cpr::Timeout{timeout_ms_});
    return toStatus(response, "sendDocument");
}

} // namespace data
