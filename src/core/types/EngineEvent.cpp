#include "core/types/EngineEvent.hpp"

namespace hostkeeper::core {

std::string eventTypeToString(EventType type) {
    switch (type) {
    case EventType::UpdateReceived:
        return "update_received";
    case EventType::HostInitialized:
        return "host_initialized";
    case EventType::HostInitializedFromCache:
        return "host_initialized_from_cache";
    case EventType::MonitorStateChanged:
        return "monitor_state_changed";
    case EventType::MonitoringDataReceived:
        return "monitoring_data_received";
    case EventType::CommandResultReceived:
        return "command_result_received";
    case EventType::ErrorReceived:
        return "error_received";
    case EventType::ConfirmationDialogOpened:
        return "confirmation_dialog_opened";
    case EventType::DetailsDialogOpened:
        return "details_dialog_opened";
    case EventType::TextDialogOpened:
        return "text_dialog_opened";
    case EventType::InputDialogOpened:
        return "input_dialog_opened";
    case EventType::ConfigurationChanged:
        return "configuration_changed";
    }
    return "unknown";
}

EngineEvent EngineEvent::forHost(EventType type, std::string hostId) {
    EngineEvent event;
    event.type = type;
    event.hostId = std::move(hostId);
    return event;
}

EngineEvent EngineEvent::error(Criticality criticality, std::string message, std::string hostId) {
    EngineEvent event;
    event.type = EventType::ErrorReceived;
    event.criticality = criticality;
    event.message = std::move(message);
    event.hostId = std::move(hostId);
    return event;
}

} // namespace hostkeeper::core
