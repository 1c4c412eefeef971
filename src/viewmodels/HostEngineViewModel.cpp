#include "viewmodels/HostEngineViewModel.hpp"

#include <QMetaObject>
#include <spdlog/spdlog.h>

namespace hostkeeper::viewmodels {

using core::EventType;

HostEngineViewModel::HostEngineViewModel(engine::HostEngine& engine, QObject* parent)
    : QObject(parent), engine_(engine) {
    subscriptionId_ = engine_.subscribe([this](const core::EngineEvent& event) {
        QMetaObject::invokeMethod(this, [this, event]() { onEvent(event); }, Qt::QueuedConnection);
    });
}

HostEngineViewModel::~HostEngineViewModel() {
    engine_.unsubscribe(subscriptionId_);
    engine_.events().flush();
}

QStringList HostEngineViewModel::hostIds() const {
    return toStringList(engine_.hostIds());
}

QString HostEngineViewModel::hostStatus(const QString& hostId) const {
    auto state = engine_.getHostState(hostId.toStdString());
    auto status = state ? state->status : core::HostStatus::Uninitialized;
    return QString::fromStdString(core::hostStatusToString(status));
}

core::Criticality HostEngineViewModel::hostCriticality(const QString& hostId) const {
    auto state = engine_.getHostState(hostId.toStdString());
    return state ? state->aggregate : core::Criticality::NoData;
}

void HostEngineViewModel::initializeHost(const QString& hostId) {
    engine_.initializeHost(hostId.toStdString());
}

void HostEngineViewModel::forceInitializeHosts() {
    engine_.forceInitializeHosts();
}

void HostEngineViewModel::refreshMonitorsOfCategory(const QString& hostId, const QString& category) {
    engine_.refreshMonitorsOfCategory(hostId.toStdString(), category.toStdString());
}

void HostEngineViewModel::cachedRefreshMonitorsOfCategory(const QString& hostId, const QString& category) {
    engine_.cachedRefreshMonitorsOfCategory(hostId.toStdString(), category.toStdString());
}

core::InvocationId HostEngineViewModel::execute(const QString& hostId, const QString& commandId,
                                                const QStringList& params) {
    return engine_.execute(hostId.toStdString(), commandId.toStdString(), toStdVector(params));
}

core::InvocationId HostEngineViewModel::executeConfirmed(const QString& hostId, const QString& commandId,
                                                         const QStringList& params) {
    return engine_.executeConfirmed(hostId.toStdString(), commandId.toStdString(), toStdVector(params));
}

bool HostEngineViewModel::confirmExecution(core::InvocationId invocationId) {
    return engine_.confirmExecution(invocationId);
}

bool HostEngineViewModel::cancel(core::InvocationId invocationId) {
    return engine_.cancel(invocationId);
}

QStringList HostEngineViewModel::getCommands(const QString& hostId) const {
    return toStringList(engine_.getCommands(hostId.toStdString()));
}

QStringList HostEngineViewModel::getChildCommands(const QString& hostId, const QString& category,
                                                  const QString& monitorId, int level,
                                                  const std::vector<std::string>& tags) const {
    QStringList result;
    for (const auto& commandId :
         engine_.getChildCommands(hostId.toStdString(), category.toStdString(), monitorId.toStdString(), level)) {
        auto command = engine_.modules().command(commandId);
        if (command && command->descriptor().display.acceptsTags(tags)) {
            result.append(QString::fromStdString(commandId));
        }
    }
    return result;
}

bool HostEngineViewModel::reconfigure() {
    return engine_.reconfigure();
}

void HostEngineViewModel::onEvent(const core::EngineEvent& event) {
    ++eventsHandled_;
    const auto hostId = QString::fromStdString(event.hostId);
    const auto moduleId = QString::fromStdString(event.moduleId);

    switch (event.type) {
    case EventType::UpdateReceived:
        emit updateReceived(hostId);
        break;
    case EventType::HostInitialized:
        emit hostInitialized(hostId);
        break;
    case EventType::HostInitializedFromCache:
        emit hostInitializedFromCache(hostId);
        break;
    case EventType::MonitorStateChanged:
        emit monitorStateChanged(hostId, moduleId, event.criticality);
        break;
    case EventType::MonitoringDataReceived:
        if (event.data) {
            emit monitoringDataReceived(hostId, moduleId, event.invocationId, *event.data);
        }
        break;
    case EventType::CommandResultReceived:
        if (event.result) {
            emit commandResultReceived(hostId, *event.result);
        }
        break;
    case EventType::ErrorReceived:
        emit errorReceived(event.criticality, QString::fromStdString(event.message));
        break;
    case EventType::ConfirmationDialogOpened:
        emit confirmationDialogOpened(hostId, moduleId, event.invocationId, QString::fromStdString(event.message));
        break;
    case EventType::DetailsDialogOpened:
        emit detailsDialogOpened(event.invocationId);
        break;
    case EventType::TextDialogOpened:
        emit textDialogOpened(event.invocationId);
        break;
    case EventType::InputDialogOpened:
        emit inputDialogOpened(event.inputSpecs, hostId, moduleId, toStringList(event.params));
        break;
    case EventType::ConfigurationChanged:
        emit configurationChanged(toStringList(event.hostIds));
        break;
    }
}

QStringList HostEngineViewModel::toStringList(const std::vector<std::string>& values) {
    QStringList result;
    result.reserve(static_cast<qsizetype>(values.size()));
    for (const auto& value : values) {
        result.append(QString::fromStdString(value));
    }
    return result;
}

std::vector<std::string> HostEngineViewModel::toStdVector(const QStringList& values) {
    std::vector<std::string> result;
    result.reserve(static_cast<size_t>(values.size()));
    for (const auto& value : values) {
        result.push_back(value.toStdString());
    }
    return result;
}

} // namespace hostkeeper::viewmodels
