#include "core/types/CommandResult.hpp"

namespace hostkeeper::core {

CommandResult CommandResult::success(std::string message, Criticality criticality) {
    CommandResult result;
    result.message_ = std::move(message);
    result.criticality_ = criticality;
    return result;
}

CommandResult CommandResult::warning(std::string message) {
    return success(std::move(message), Criticality::Warning);
}

CommandResult CommandResult::error(std::string errorText, Criticality criticality) {
    CommandResult result;
    result.error_ = std::move(errorText);
    result.criticality_ = criticality;
    return result;
}

CommandResult CommandResult::parseFailure(std::string errorText) {
    return error(std::move(errorText), Criticality::NoData);
}

CommandResult CommandResult::withInvocation(InvocationId id, std::string commandId) const {
    CommandResult copy = *this;
    copy.invocationId_ = id;
    copy.commandId_ = std::move(commandId);
    return copy;
}

CommandResult CommandResult::withFlags(bool showInNotification, bool opensDetailsDialog) const {
    CommandResult copy = *this;
    copy.showInNotification_ = showInNotification;
    copy.opensDetailsDialog_ = opensDetailsDialog;
    return copy;
}

CommandResult CommandResult::markedFromCache() const {
    CommandResult copy = *this;
    copy.fromCache_ = true;
    return copy;
}

nlohmann::json CommandResult::toJson() const {
    nlohmann::json j;
    j["invocation_id"] = invocationId_;
    j["command_id"] = commandId_;
    j["message"] = message_;
    j["error"] = error_;
    j["criticality"] = criticalityToString(criticality_);
    j["show_in_notification"] = showInNotification_;
    j["opens_details_dialog"] = opensDetailsDialog_;
    j["timestamp"] =
        std::chrono::duration_cast<std::chrono::milliseconds>(timestamp_.time_since_epoch()).count();
    return j;
}

CommandResult CommandResult::fromJson(const nlohmann::json& j) {
    CommandResult result;
    result.invocationId_ = j.value("invocation_id", InvocationId{0});
    result.commandId_ = j.value("command_id", "");
    result.message_ = j.value("message", "");
    result.error_ = j.value("error", "");
    result.criticality_ = criticalityFromString(j.value("criticality", "Normal"));
    result.showInNotification_ = j.value("show_in_notification", true);
    result.opensDetailsDialog_ = j.value("opens_details_dialog", false);
    result.timestamp_ = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(j.value("timestamp", int64_t{0})));
    return result;
}

} // namespace hostkeeper::core
