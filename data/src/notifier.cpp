#include "notifier.hpp"
#include "logging.hpp"

namespace data {

core::Status LogNotifier::sendMessage(const std::string& text) {
    core::logging::getLogger()->info("[notify] {}", text);
    return core::success();
}

core::Status LogNotifier::sendDocument(const std::string& path, const std::string& caption) {
    core::logging::getLogger()->info("[notify] {} (document: {})", caption, path);
    return core::success();
}

bool reportDelivery(const core::Status& status, const char* what) {
    if (status) {
        return true;
    }
    core::logging::getLogger()->warn("Notification '{}' not delivered ({}): {}", what,
                                     core::errorKindToString(status.error().kind), status.error().message);
    return false;
}

} // namespace data
