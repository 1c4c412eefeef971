/**
 * @file EngineEvent.hpp
 * @brief Events published by the engine on the event bus.
 */

#pragma once

#include "core/types/CommandResult.hpp"
#include "core/types/Criticality.hpp"
#include "core/types/InputSpec.hpp"
#include "core/types/Invocation.hpp"
#include "core/types/MonitorDataPoint.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hostkeeper::core {

enum class EventType : int {
    UpdateReceived = 0,          ///< Host state changed in some way
    HostInitialized = 1,         ///< Live initialization finished
    HostInitializedFromCache = 2,
    MonitorStateChanged = 3,     ///< Aggregate criticality of a host changed
    MonitoringDataReceived = 4,
    CommandResultReceived = 5,
    ErrorReceived = 6,
    ConfirmationDialogOpened = 7,
    DetailsDialogOpened = 8,
    TextDialogOpened = 9,
    InputDialogOpened = 10,
    ConfigurationChanged = 11    ///< Effective configuration of some hosts changed
};

[[nodiscard]] std::string eventTypeToString(EventType type);

/**
 * @brief A single engine event.
 *
 * Only the fields relevant to the event type are filled in.
 */
struct EngineEvent {
    EventType type{EventType::UpdateReceived};
    std::string hostId;
    std::string moduleId;
    InvocationId invocationId{0};
    Criticality criticality{Criticality::NoData};
    std::string message;
    std::optional<MonitorDataPoint> data;  ///< MonitoringDataReceived
    std::optional<CommandResult> result;   ///< CommandResultReceived
    std::vector<InputSpec> inputSpecs;     ///< InputDialogOpened
    std::vector<std::string> params;       ///< InputDialogOpened, ConfirmationDialogOpened
    std::vector<std::string> hostIds;      ///< ConfigurationChanged

    static EngineEvent forHost(EventType type, std::string hostId);
    static EngineEvent error(Criticality criticality, std::string message, std::string hostId = {});
};

} // namespace hostkeeper::core
